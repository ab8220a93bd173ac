#pragma once

#include <QString>
#include <vector>
#include "AppConstants.h"
#include "CutPlan.h"

enum class VideoStrategy {
    Copy,
    Reencode
};

struct VideoEncodeParams {
    QString codec = AppConstants::DefaultVideoCodec;
    int crf = AppConstants::DefaultCrf;
    QString preset = AppConstants::DefaultPreset;

    bool operator==(const VideoEncodeParams& o) const {
        return codec == o.codec && crf == o.crf && preset == o.preset;
    }
};

struct AudioEncodeParams {
    QString codec = AppConstants::DefaultAudioCodec;
    int bitrate = AppConstants::DefaultAudioBitrate;

    bool operator==(const AudioEncodeParams& o) const {
        return codec == o.codec && bitrate == o.bitrate;
    }
};

struct EncoderProfile {
    VideoEncodeParams video;
    AudioEncodeParams audio;

    bool operator==(const EncoderProfile& o) const { return video == o.video && audio == o.audio; }
};

enum class AudioOutput {
    None,           // no audio stream in the output at all
    Passthrough,    // single untouched source stream, copied
    Mixed           // filter graph output, encoded
};

enum class AudioStageKind {
    Gain,       // one per enabled source track
    Mix,        // sums the gain outputs when there is more than one
    Normalize   // dynamic range normalization of the final mix
};

struct AudioFilterStage {
    AudioStageKind kind = AudioStageKind::Gain;
    int streamIndex = -1;       // Gain
    int audioOrdinal = -1;      // Gain
    double gainDb = 0.0;        // Gain
    double multiplier = 1.0;    // Gain: 10^(gainDb/20)
    int inputCount = 0;         // Mix

    bool operator==(const AudioFilterStage& o) const {
        return kind == o.kind && streamIndex == o.streamIndex && audioOrdinal == o.audioOrdinal
            && gainDb == o.gainDb && multiplier == o.multiplier && inputCount == o.inputCount;
    }
};

// Fully resolved export request. Holds no references into session state.
struct ExportSpec {
    QString inputPath;
    QString outputPath;
    int videoStreamIndex = -1;
    CutPlan cutPlan;

    VideoStrategy videoStrategy = VideoStrategy::Copy;
    VideoEncodeParams videoParams;          // used for Reencode only

    AudioOutput audioOutput = AudioOutput::None;
    std::vector<int> audioStreams;          // mapped source streams, source order
    std::vector<AudioFilterStage> audioFilterGraph;
    AudioEncodeParams audioParams;          // used for Mixed only
    bool normalize = false;

    double durationSeconds() const { return cutPlan.duration(); }

    bool operator==(const ExportSpec& o) const {
        return inputPath == o.inputPath && outputPath == o.outputPath
            && videoStreamIndex == o.videoStreamIndex && cutPlan == o.cutPlan
            && videoStrategy == o.videoStrategy && videoParams == o.videoParams
            && audioOutput == o.audioOutput && audioStreams == o.audioStreams
            && audioFilterGraph == o.audioFilterGraph && audioParams == o.audioParams
            && normalize == o.normalize;
    }
    bool operator!=(const ExportSpec& o) const { return !(*this == o); }
};
