#pragma once

#include <QThread>
#include <atomic>
#include <vector>
#include "media/MediaEngine.h"

// Canned MediaEngine for tests: no files, no processes.
class FakeMediaEngine : public MediaEngine {
public:
    ProbeResult probeResult;
    ExecutionResult executionResult;
    std::vector<double> progressSteps;
    bool waitForCancel = false;     // execute() blocks until cancelled

    std::atomic<int> probeCount{0};
    std::atomic<int> executeCount{0};
    ExportSpec lastSpec;

    ProbeResult probe(const QString& filePath) override {
        ++probeCount;
        ProbeResult r = probeResult;
        r.info.filePath = filePath;
        return r;
    }

    ExecutionResult execute(const ExportSpec& spec,
                            const std::atomic<bool>& cancelRequested,
                            const ProgressCallback& progress) override {
        ++executeCount;
        lastSpec = spec;
        for (double step : progressSteps) {
            if (progress) progress(step);
        }
        if (waitForCancel) {
            while (!cancelRequested.load()) {
                QThread::msleep(5);
            }
            ExecutionResult cancelled;
            cancelled.status = ExecutionStatus::Cancelled;
            cancelled.outputPath = spec.outputPath;
            cancelled.exitCode = -1;
            return cancelled;
        }
        ExecutionResult r = executionResult;
        r.outputPath = spec.outputPath;
        return r;
    }
};

// 10 s at 30 fps, one video stream, two stereo audio streams,
// keyframes every 2 s.
inline MediaInfo makeTestMediaInfo() {
    MediaInfo info;
    info.containerFormat = "mov,mp4,m4a,3gp,3g2,mj2";
    info.durationSeconds = 10.0;
    info.videoStreamIndex = 0;

    StreamInfo video;
    video.streamIndex = 0;
    video.kind = StreamKind::Video;
    video.codecName = "h264";
    video.durationSeconds = 10.0;
    video.frameRate = Rational{30, 1};
    video.width = 1920;
    video.height = 1080;
    info.streams.push_back(video);

    for (int i = 0; i < 2; ++i) {
        StreamInfo audio;
        audio.streamIndex = i + 1;
        audio.kind = StreamKind::Audio;
        audio.codecName = "aac";
        audio.durationSeconds = 10.0;
        audio.audioOrdinal = i;
        audio.channelCount = 2;
        audio.sampleRate = 48000;
        info.streams.push_back(audio);
    }

    info.keyframeTimestamps = {0.0, 2.0, 4.0, 6.0, 8.0};
    return info;
}
