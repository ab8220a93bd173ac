#include "FfmpegEngine.h"
#include "FfmpegCommand.h"
#include "MediaProbe.h"
#include "Logging.h"
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <algorithm>

namespace {

constexpr int StartTimeoutMs = 5000;
constexpr int PollIntervalMs = 100;
constexpr int KillTimeoutMs = 3000;

void appendCapped(QString& buffer, const QString& text) {
    buffer += text;
    if (buffer.size() > FfmpegEngine::MaxStderrChars) {
        buffer.remove(0, buffer.size() - FfmpegEngine::MaxStderrChars);
    }
}

} // namespace

FfmpegEngine::FfmpegEngine(const QString& ffmpegPath)
    : m_ffmpegPath(ffmpegPath.isEmpty() ? QStringLiteral("ffmpeg") : ffmpegPath) {}

FfmpegEngine::~FfmpegEngine() = default;

ProbeResult FfmpegEngine::probe(const QString& filePath) {
    ProbeResult result;
    MediaProbe probe;
    result.ok = probe.probe(filePath);
    result.info = probe.info();
    result.error = probe.errorString();
    return result;
}

bool FfmpegEngine::isAvailable(QString* version) const {
    QProcess proc;
    proc.start(m_ffmpegPath, QStringList() << "-hide_banner" << "-version");
    if (!proc.waitForStarted(StartTimeoutMs) || !proc.waitForFinished(StartTimeoutMs)) {
        proc.kill();
        proc.waitForFinished(KillTimeoutMs);
        return false;
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        return false;
    }
    if (version) {
        *version = QString::fromUtf8(proc.readAllStandardOutput()).section('\n', 0, 0).trimmed();
    }
    return true;
}

ExecutionResult FfmpegEngine::execute(const ExportSpec& spec,
                                      const std::atomic<bool>& cancelRequested,
                                      const ProgressCallback& progress) {
    ExecutionResult result;
    result.outputPath = spec.outputPath;

    const QStringList args = FfmpegCommand::buildArguments(spec);
    qCInfo(mixcutExport, "%s %s", qPrintable(m_ffmpegPath), qPrintable(args.join(' ')));

    // A failed run must not take a pre-existing, untouched file with it
    const QFileInfo previous(spec.outputPath);
    const bool existedBefore = previous.exists();
    const QDateTime modifiedBefore = previous.lastModified();

    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(m_ffmpegPath, args);
    if (!proc.waitForStarted(StartTimeoutMs)) {
        result.status = ExecutionStatus::StartFailed;
        result.exitCode = -1;
        result.stderrText = QString("Cannot start %1: %2").arg(m_ffmpegPath, proc.errorString());
        qCWarning(mixcutExport, "%s", qPrintable(result.stderrText));
        return result;
    }

    const double total = spec.durationSeconds();
    QString pendingLine;
    auto drainOutput = [&]() {
        QString chunk = QString::fromUtf8(proc.readAll());
        if (chunk.isEmpty()) return;
        appendCapped(result.stderrText, chunk);

        // ffmpeg ends status lines with \r while it runs
        pendingLine += chunk;
        pendingLine.replace('\r', '\n');
        QStringList lines = pendingLine.split('\n');
        pendingLine = lines.takeLast();
        for (const QString& line : lines) {
            double seconds = 0.0;
            if (progress && total > 0.0 && FfmpegCommand::parseProgressTime(line, seconds)) {
                progress(std::min(0.99, seconds / total));
            }
        }
    };

    bool cancelled = false;
    while (!proc.waitForFinished(PollIntervalMs)) {
        if (proc.state() == QProcess::NotRunning) break;
        drainOutput();
        if (cancelRequested.load()) {
            cancelled = true;
            proc.kill();
            proc.waitForFinished(KillTimeoutMs);
            break;
        }
    }
    drainOutput();
    if (!pendingLine.isEmpty()) {
        double seconds = 0.0;
        if (progress && total > 0.0 && FfmpegCommand::parseProgressTime(pendingLine, seconds)) {
            progress(std::min(0.99, seconds / total));
        }
    }

    result.exitCode = proc.exitCode();

    if (cancelled) {
        result.status = ExecutionStatus::Cancelled;
    } else if (proc.exitStatus() == QProcess::CrashExit) {
        result.status = ExecutionStatus::Crashed;
    } else if (result.exitCode != 0) {
        result.status = ExecutionStatus::Failed;
    } else {
        QFileInfo out(spec.outputPath);
        result.status = (out.exists() && out.size() > 0) ? ExecutionStatus::Success
                                                          : ExecutionStatus::OutputInvalid;
    }

    if (result.status == ExecutionStatus::Success) {
        if (progress) progress(1.0);
        qCInfo(mixcutExport, "export finished: %s", qPrintable(spec.outputPath));
    } else {
        // Whatever ffmpeg left behind is not a valid export
        const QFileInfo leftover(spec.outputPath);
        const bool touched = !existedBefore || leftover.lastModified() != modifiedBefore;
        if (leftover.exists() && touched && !QFile::remove(spec.outputPath)) {
            qCWarning(mixcutExport, "cannot remove partial output %s", qPrintable(spec.outputPath));
        }
        qCWarning(mixcutExport, "export did not complete (status %d, exit code %d)",
                  static_cast<int>(result.status), result.exitCode);
    }
    return result;
}
