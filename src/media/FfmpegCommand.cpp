#include "FfmpegCommand.h"
#include "TimeUtil.h"
#include <QRegularExpression>

namespace FfmpegCommand {

namespace {

QString streamSpecifier(int streamIndex) {
    return QString("0:%1").arg(streamIndex);
}

QString formatMultiplier(double multiplier) {
    return QString::number(multiplier, 'f', 6);
}

} // namespace

QString buildAudioFilterGraph(const ExportSpec& spec) {
    if (spec.audioOutput != AudioOutput::Mixed) return QString();

    QStringList chains;
    QStringList pending;    // labels waiting for the next stage
    int gainCount = 0;

    for (const auto& stage : spec.audioFilterGraph) {
        switch (stage.kind) {
        case AudioStageKind::Gain: {
            QString source = QString("[%1]").arg(streamSpecifier(stage.streamIndex));
            if (stage.multiplier == 1.0) {
                pending << source;
            } else {
                QString label = QString("[g%1]").arg(gainCount);
                chains << QString("%1volume=%2%3").arg(source, formatMultiplier(stage.multiplier), label);
                pending << label;
            }
            ++gainCount;
            break;
        }
        case AudioStageKind::Mix:
            // Plain sum: amix would otherwise scale every input by 1/N
            chains << QString("%1amix=inputs=%2:normalize=0[mix]").arg(pending.join(QString())).arg(stage.inputCount);
            pending = QStringList{"[mix]"};
            break;
        case AudioStageKind::Normalize:
            chains << QString("%1dynaudnorm[norm]").arg(pending.join(QString()));
            pending = QStringList{"[norm]"};
            break;
        }
    }

    if (pending.size() != 1) return QString();

    // Rename the last produced label to the fixed output label
    const QString out = QString("[%1]").arg(AudioOutLabel);
    if (!chains.isEmpty() && chains.last().endsWith(pending.first())) {
        QString& last = chains.last();
        last.chop(pending.first().size());
        last += out;
    } else {
        chains << QString("%1anull%2").arg(pending.first(), out);
    }
    return chains.join(';');
}

QStringList buildArguments(const ExportSpec& spec) {
    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-y"
         << "-ss" << TimeUtil::secondsToFfmpegTime(spec.cutPlan.startSeconds)
         << "-to" << TimeUtil::secondsToFfmpegTime(spec.cutPlan.endSeconds)
         << "-i" << spec.inputPath;

    args << "-map" << (spec.videoStreamIndex >= 0 ? streamSpecifier(spec.videoStreamIndex)
                                                   : QString("0:v:0"));
    if (spec.videoStrategy == VideoStrategy::Copy) {
        args << "-c:v" << "copy" << "-avoid_negative_ts" << "make_zero";
    } else {
        args << "-c:v" << spec.videoParams.codec
             << "-crf" << QString::number(spec.videoParams.crf)
             << "-preset" << spec.videoParams.preset;
    }

    switch (spec.audioOutput) {
    case AudioOutput::None:
        args << "-an";
        break;
    case AudioOutput::Passthrough:
        args << "-map" << streamSpecifier(spec.audioStreams.front()) << "-c:a" << "copy";
        break;
    case AudioOutput::Mixed:
        args << "-filter_complex" << buildAudioFilterGraph(spec)
             << "-map" << QString("[%1]").arg(AudioOutLabel)
             << "-c:a" << spec.audioParams.codec
             << "-b:a" << QString::number(spec.audioParams.bitrate);
        break;
    }

    args << "-sn" << "-dn" << spec.outputPath;
    return args;
}

bool parseProgressTime(const QString& line, double& seconds) {
    static const QRegularExpression re(R"(time=\s*(\d+:\d{2}:\d{2}(?:\.\d+)?))");
    auto match = re.match(line);
    if (!match.hasMatch()) return false;
    return TimeUtil::parseHMS(match.captured(1), seconds);
}

} // namespace FfmpegCommand
