#pragma once

namespace AppConstants {
    // Audio gain range exposed by the track sliders
    inline constexpr double MinGainDb = -30.0;
    inline constexpr double MaxGainDb = 30.0;

    // Default encoder profile for precise (re-encoded) exports
    inline constexpr const char* DefaultVideoCodec = "libx264";
    inline constexpr int DefaultCrf = 18;
    inline constexpr const char* DefaultPreset = "fast";
    inline constexpr const char* DefaultAudioCodec = "aac";
    inline constexpr int DefaultAudioBitrate = 192000;

    inline constexpr const char* DefaultOutputSuffix = "_cut";
    inline constexpr const char* DefaultOutputExtension = "mp4";

    // Overrides the ffmpeg executable lookup
    inline constexpr const char* FfmpegEnvVar = "MIXCUT_FFMPEG";
}
