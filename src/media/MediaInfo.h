#pragma once

#include <QString>
#include <vector>
#include "Rational.h"

enum class StreamKind {
    Video,
    Audio,
    Other
};

struct StreamInfo {
    int streamIndex = -1;       // absolute index in the container
    StreamKind kind = StreamKind::Other;
    QString codecName;
    double durationSeconds = 0.0;

    // Video
    Rational frameRate;
    int width = 0;
    int height = 0;

    // Audio
    int audioOrdinal = -1;      // position among audio streams (ffmpeg "0:a:N")
    int channelCount = 0;
    int sampleRate = 0;
    QString language;
    QString title;
};

struct MediaInfo {
    QString filePath;
    QString containerFormat;
    double durationSeconds = 0.0;
    std::vector<StreamInfo> streams;    // probe order
    int videoStreamIndex = -1;          // primary video stream, -1 if none

    // Keyframe presentation times of the primary video stream, seconds from start
    std::vector<double> keyframeTimestamps;

    const StreamInfo* videoStream() const {
        for (const auto& s : streams) {
            if (s.streamIndex == videoStreamIndex) return &s;
        }
        return nullptr;
    }

    std::vector<StreamInfo> audioStreams() const {
        std::vector<StreamInfo> result;
        for (const auto& s : streams) {
            if (s.kind == StreamKind::Audio) result.push_back(s);
        }
        return result;
    }

    bool hasVideo() const { return videoStreamIndex >= 0; }
};
