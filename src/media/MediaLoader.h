#pragma once

#include <QObject>
#include <QThread>
#include <memory>
#include <vector>
#include "MediaEngine.h"

class ProbeThread : public QThread {
    Q_OBJECT
public:
    ProbeThread(MediaEngine* engine, const QString& filePath, QObject* parent = nullptr);

    const ProbeResult& result() const { return m_result; }
    QString filePath() const { return m_filePath; }

protected:
    void run() override;

private:
    MediaEngine* m_engine;
    const QString m_filePath;
    ProbeResult m_result;
};

// Probes a file off the interactive thread. A newer load() supersedes an
// older one still running; only the latest result is delivered.
class MediaLoader : public QObject {
    Q_OBJECT
public:
    explicit MediaLoader(MediaEngine* engine, QObject* parent = nullptr);
    ~MediaLoader();

    void load(const QString& filePath);
    bool isLoading() const { return m_thread != nullptr; }

signals:
    void loaded(const ProbeResult& result);

private slots:
    void onThreadFinished();

private:
    MediaEngine* m_engine;
    std::unique_ptr<ProbeThread> m_thread;
    std::vector<std::unique_ptr<ProbeThread>> m_superseded;
};
