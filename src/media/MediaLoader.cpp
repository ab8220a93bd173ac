#include "MediaLoader.h"
#include "Logging.h"
#include <algorithm>

ProbeThread::ProbeThread(MediaEngine* engine, const QString& filePath, QObject* parent)
    : QThread(parent), m_engine(engine), m_filePath(filePath) {}

void ProbeThread::run() {
    m_result = m_engine->probe(m_filePath);
}

MediaLoader::MediaLoader(MediaEngine* engine, QObject* parent)
    : QObject(parent), m_engine(engine) {}

MediaLoader::~MediaLoader() {
    if (m_thread) m_thread->wait();
    for (auto& t : m_superseded) t->wait();
}

void MediaLoader::load(const QString& filePath) {
    if (m_thread) {
        qCDebug(mixcutProbe, "probe of %s superseded", qPrintable(m_thread->filePath()));
        m_superseded.push_back(std::move(m_thread));
    }
    m_thread = std::make_unique<ProbeThread>(m_engine, filePath);
    connect(m_thread.get(), &QThread::finished, this, &MediaLoader::onThreadFinished);
    m_thread->start();
}

void MediaLoader::onThreadFinished() {
    auto* finishedThread = qobject_cast<ProbeThread*>(sender());

    if (m_thread && finishedThread == m_thread.get()) {
        std::unique_ptr<ProbeThread> done = std::move(m_thread);
        done->wait();
        emit loaded(done->result());
        return;
    }

    if (finishedThread) finishedThread->wait();
    m_superseded.erase(std::remove_if(m_superseded.begin(), m_superseded.end(),
                                      [finishedThread](const std::unique_ptr<ProbeThread>& t) {
                                          return t.get() == finishedThread;
                                      }),
                       m_superseded.end());
}
