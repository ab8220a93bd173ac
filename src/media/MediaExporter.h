#pragma once

#include <QObject>
#include <QThread>
#include <atomic>
#include <memory>
#include "MediaEngine.h"

// Runs one MediaEngine::execute call on its own thread. The ExportSpec is copied
// in, so later edits to the session cannot reach a running export.
class ExportThread : public QThread {
    Q_OBJECT
public:
    ExportThread(MediaEngine* engine, const ExportSpec& spec, QObject* parent = nullptr);

    void requestCancel() { m_cancelRequested = true; }
    const ExecutionResult& result() const { return m_result; }

signals:
    void progress(double fraction);

protected:
    void run() override;

private:
    MediaEngine* m_engine;
    const ExportSpec m_spec;
    std::atomic<bool> m_cancelRequested{false};
    ExecutionResult m_result;
};

// Asynchronous export front end. One export at a time; results arrive through
// finished() on the thread that owns the exporter. Never retries.
class MediaExporter : public QObject {
    Q_OBJECT
public:
    explicit MediaExporter(MediaEngine* engine, QObject* parent = nullptr);
    ~MediaExporter();

    bool startExport(const ExportSpec& spec);
    void cancel();
    bool isExporting() const { return m_exporting; }

    // Blocks until the running export (if any) has finished.
    void waitForFinished();

    QString errorString() const { return m_error; }

signals:
    void progress(double fraction);  // 0.0 to 1.0
    void finished(const ExecutionResult& result);

private slots:
    void onThreadFinished();

private:
    MediaEngine* m_engine;
    std::unique_ptr<ExportThread> m_thread;
    bool m_exporting = false;
    QString m_error;
};
