#pragma once

#include <QString>
#include "MediaEngine.h"

// Probes in-process through libavformat and exports by running the ffmpeg
// executable with the arguments from FfmpegCommand.
class FfmpegEngine : public MediaEngine {
public:
    explicit FfmpegEngine(const QString& ffmpegPath = QString());
    ~FfmpegEngine() override;

    ProbeResult probe(const QString& filePath) override;
    ExecutionResult execute(const ExportSpec& spec,
                            const std::atomic<bool>& cancelRequested,
                            const ProgressCallback& progress) override;

    // Runs "ffmpeg -version"; fills version with the first output line.
    bool isAvailable(QString* version = nullptr) const;

    QString ffmpegPath() const { return m_ffmpegPath; }
    void setFfmpegPath(const QString& path) { m_ffmpegPath = path; }

    // Longest stderr tail kept in an ExecutionResult
    static constexpr int MaxStderrChars = 64 * 1024;

private:
    QString m_ffmpegPath;
};
