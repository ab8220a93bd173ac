#pragma once

#include <QObject>
#include <QString>
#include <vector>
#include "MediaInfo.h"

struct AudioTrackState {
    int streamIndex = -1;
    int audioOrdinal = -1;
    bool enabled = true;
    double gainDb = 0.0;
    QString label;

    bool operator==(const AudioTrackState& o) const {
        return streamIndex == o.streamIndex && audioOrdinal == o.audioOrdinal
            && enabled == o.enabled && gainDb == o.gainDb && label == o.label;
    }
};

// Per-stream enable flag and gain of the loaded file, in probe order.
class AudioTrackModel : public QObject {
    Q_OBJECT
public:
    explicit AudioTrackModel(QObject* parent = nullptr);
    ~AudioTrackModel();

    void load(const std::vector<StreamInfo>& audioStreams);
    void clear();

    int trackCount() const { return static_cast<int>(m_tracks.size()); }
    int enabledCount() const;
    const std::vector<AudioTrackState>& tracks() const { return m_tracks; }
    const AudioTrackState* track(int streamIndex) const;

    // Both return false for an unknown stream index.
    bool setEnabled(int streamIndex, bool enabled);
    bool setGainDb(int streamIndex, double gainDb);   // clamped to the slider range

    // Detached copy handed to the export pipeline.
    std::vector<AudioTrackState> snapshot() const { return m_tracks; }

signals:
    void trackChanged(int streamIndex);
    void tracksReset();

private:
    AudioTrackState* findTrack(int streamIndex);

    std::vector<AudioTrackState> m_tracks;
};
