#include "AudioTrackModel.h"
#include "AppConstants.h"
#include <algorithm>
#include <cmath>

AudioTrackModel::AudioTrackModel(QObject* parent) : QObject(parent) {}
AudioTrackModel::~AudioTrackModel() = default;

void AudioTrackModel::load(const std::vector<StreamInfo>& audioStreams) {
    m_tracks.clear();
    for (const auto& s : audioStreams) {
        if (s.kind != StreamKind::Audio) continue;
        AudioTrackState t;
        t.streamIndex = s.streamIndex;
        t.audioOrdinal = s.audioOrdinal;
        t.label = QString("Track %1").arg(s.audioOrdinal + 1);
        if (!s.title.isEmpty()) t.label += QString(" - %1").arg(s.title);
        if (!s.language.isEmpty()) t.label += QString(" [%1]").arg(s.language);
        m_tracks.push_back(t);
    }
    emit tracksReset();
}

void AudioTrackModel::clear() {
    m_tracks.clear();
    emit tracksReset();
}

int AudioTrackModel::enabledCount() const {
    return static_cast<int>(std::count_if(m_tracks.begin(), m_tracks.end(),
                                          [](const AudioTrackState& t) { return t.enabled; }));
}

const AudioTrackState* AudioTrackModel::track(int streamIndex) const {
    for (const auto& t : m_tracks) {
        if (t.streamIndex == streamIndex) return &t;
    }
    return nullptr;
}

AudioTrackState* AudioTrackModel::findTrack(int streamIndex) {
    for (auto& t : m_tracks) {
        if (t.streamIndex == streamIndex) return &t;
    }
    return nullptr;
}

bool AudioTrackModel::setEnabled(int streamIndex, bool enabled) {
    AudioTrackState* t = findTrack(streamIndex);
    if (!t) return false;
    if (t->enabled != enabled) {
        t->enabled = enabled;
        emit trackChanged(streamIndex);
    }
    return true;
}

bool AudioTrackModel::setGainDb(int streamIndex, double gainDb) {
    AudioTrackState* t = findTrack(streamIndex);
    if (!t || !std::isfinite(gainDb)) return false;
    gainDb = std::clamp(gainDb, AppConstants::MinGainDb, AppConstants::MaxGainDb);
    if (t->gainDb != gainDb) {
        t->gainDb = gainDb;
        emit trackChanged(streamIndex);
    }
    return true;
}
