#include "ExportPipelineBuilder.h"
#include "Logging.h"
#include <QFileInfo>
#include <cmath>

double ExportPipelineBuilder::gainToMultiplier(double gainDb) {
    if (gainDb == 0.0) return 1.0;
    return std::pow(10.0, gainDb / 20.0);
}

bool ExportPipelineBuilder::build(const ExportTarget& target, const CutPlan& plan,
                                  const std::vector<AudioTrackState>& tracks, bool normalize,
                                  ExportSpec& out) {
    out = ExportSpec{};
    m_errorCode = MixCutError::None;
    m_error.clear();

    if (!plan.isValid()) {
        return fail(MixCutError::NoActiveTimeline, "No valid cut plan to export");
    }
    if (target.outputPath.isEmpty()) {
        return fail(MixCutError::InvalidOutputPath, "No output path given");
    }
    if (QFileInfo(target.outputPath).absoluteFilePath() == QFileInfo(target.inputPath).absoluteFilePath()) {
        return fail(MixCutError::InvalidOutputPath,
                    QString("Output would overwrite the source: %1").arg(target.outputPath));
    }

    ExportSpec spec;
    spec.inputPath = target.inputPath;
    spec.outputPath = target.outputPath;
    spec.videoStreamIndex = target.videoStreamIndex;
    spec.cutPlan = plan;

    if (plan.requiresReencode) {
        spec.videoStrategy = VideoStrategy::Reencode;
        spec.videoParams = m_profile.video;
    } else {
        spec.videoStrategy = VideoStrategy::Copy;
    }

    // Gain stages first, in source order. Disabled tracks never reach the graph.
    for (const auto& t : tracks) {
        if (!t.enabled) continue;
        if (!std::isfinite(t.gainDb)
            || t.gainDb < AppConstants::MinGainDb || t.gainDb > AppConstants::MaxGainDb) {
            return fail(MixCutError::GainOutOfRange,
                        QString("Gain %1 dB of stream %2 is outside [%3, %4] dB")
                            .arg(t.gainDb).arg(t.streamIndex)
                            .arg(AppConstants::MinGainDb).arg(AppConstants::MaxGainDb));
        }
        AudioFilterStage stage;
        stage.kind = AudioStageKind::Gain;
        stage.streamIndex = t.streamIndex;
        stage.audioOrdinal = t.audioOrdinal;
        stage.gainDb = t.gainDb;
        stage.multiplier = gainToMultiplier(t.gainDb);
        spec.audioFilterGraph.push_back(stage);
        spec.audioStreams.push_back(t.streamIndex);
    }

    const int activeCount = static_cast<int>(spec.audioStreams.size());
    if (activeCount == 0) {
        spec.audioOutput = AudioOutput::None;
        spec.audioFilterGraph.clear();
        spec.normalize = false;
        qCDebug(mixcutExport, "no enabled audio tracks: output has no audio");
    } else {
        if (activeCount > 1) {
            AudioFilterStage mix;
            mix.kind = AudioStageKind::Mix;
            mix.inputCount = activeCount;
            spec.audioFilterGraph.push_back(mix);
        }
        // Normalization sees the finished mix, never the individual tracks
        if (normalize) {
            AudioFilterStage norm;
            norm.kind = AudioStageKind::Normalize;
            spec.audioFilterGraph.push_back(norm);
        }
        spec.normalize = normalize;

        const bool untouched = activeCount == 1 && !normalize
                            && spec.audioFilterGraph.front().multiplier == 1.0;
        spec.audioOutput = untouched ? AudioOutput::Passthrough : AudioOutput::Mixed;
        spec.audioParams = m_profile.audio;
    }

    qCDebug(mixcutExport, "export spec: video %s, %d audio track(s), %d stage(s), normalize %d",
            spec.videoStrategy == VideoStrategy::Copy ? "copy" : "re-encode",
            activeCount, static_cast<int>(spec.audioFilterGraph.size()), spec.normalize);

    out = spec;
    return true;
}

bool ExportPipelineBuilder::fail(MixCutError code, const QString& message) {
    m_errorCode = code;
    m_error = message;
    qCWarning(mixcutExport, "%s: %s", qPrintable(mixCutErrorName(code)), qPrintable(message));
    return false;
}
