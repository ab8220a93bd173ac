#pragma once

#include <QObject>
#include <QString>
#include "MediaInfo.h"

// Reads container/stream metadata and the keyframe list of the primary
// video stream through libavformat. Packets are only demuxed, never decoded.
class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

    // Keyframe scan reads every packet; disable for metadata-only probes
    void setScanKeyframes(bool scan) { m_scanKeyframes = scan; }
    bool scanKeyframes() const { return m_scanKeyframes; }

signals:
    void keyframeScanProgress(double fraction);

private:
    MediaInfo m_info;
    QString m_error;
    bool m_scanKeyframes = true;
};
