#include "MediaExporter.h"
#include "Logging.h"
#include <QFile>

// --- ExportThread ---

ExportThread::ExportThread(MediaEngine* engine, const ExportSpec& spec, QObject* parent)
    : QThread(parent), m_engine(engine), m_spec(spec) {}

void ExportThread::run() {
    m_result = m_engine->execute(m_spec, m_cancelRequested,
                                 [this](double fraction) { emit progress(fraction); });
    // Cancel raced with a successful finish: the output is still not wanted
    if (m_cancelRequested && m_result.status != ExecutionStatus::Cancelled) {
        qCInfo(mixcutExport, "export cancelled after engine finished");
        m_result.status = ExecutionStatus::Cancelled;
    }
}

// --- MediaExporter ---

MediaExporter::MediaExporter(MediaEngine* engine, QObject* parent)
    : QObject(parent), m_engine(engine) {}

MediaExporter::~MediaExporter() {
    cancel();
    waitForFinished();
}

bool MediaExporter::startExport(const ExportSpec& spec) {
    if (!m_engine) {
        m_error = "No media engine";
        return false;
    }
    if (m_exporting) {
        m_error = "An export is already running";
        return false;
    }
    if (!spec.cutPlan.isValid()) {
        m_error = "Export spec has no valid cut plan";
        return false;
    }

    m_error.clear();
    m_thread = std::make_unique<ExportThread>(m_engine, spec);
    connect(m_thread.get(), &ExportThread::progress, this, &MediaExporter::progress);
    connect(m_thread.get(), &QThread::finished, this, &MediaExporter::onThreadFinished);
    m_exporting = true;
    m_thread->start();
    return true;
}

void MediaExporter::cancel() {
    if (m_thread && m_exporting) {
        m_thread->requestCancel();
    }
}

void MediaExporter::waitForFinished() {
    if (m_thread) {
        m_thread->wait();
    }
}

void MediaExporter::onThreadFinished() {
    if (!m_thread || !m_exporting) return;

    m_thread->wait();
    ExecutionResult result = m_thread->result();
    m_exporting = false;

    // Cancelled output is never valid, whatever the engine did with it
    if (result.status == ExecutionStatus::Cancelled && QFile::exists(result.outputPath)
        && !QFile::remove(result.outputPath)) {
        qCWarning(mixcutExport, "cannot remove cancelled output %s", qPrintable(result.outputPath));
    }
    if (!result.ok()) {
        m_error = QString("%1 (exit code %2)").arg(mixCutErrorName(result.error())).arg(result.exitCode);
    }
    emit finished(result);
}
