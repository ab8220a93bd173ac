#pragma once

#include <QObject>
#include <QString>
#include <cstdint>
#include "MediaEngine.h"
#include "MixCutConfig.h"
#include "KeyframeIndex.h"
#include "TimelineModel.h"
#include "AudioTrackModel.h"
#include "CutPlan.h"
#include "MixCutError.h"

struct ExportOptions {
    CutMode mode = CutMode::Precise;
    QString outputPath;         // empty: defaultOutputPath()
    bool normalize = true;
};

// "(key) current / total" readout next to the video
struct PlayheadInfo {
    int64_t nearestKeyframeFrame = -1;     // -1 without keyframes
    int64_t currentFrame = 0;
    int64_t totalFrames = 0;
};

// The one loaded file and everything derived from it. Lives on the
// interactive thread; exports only ever see a resolved ExportSpec copy.
class EditSession : public QObject {
    Q_OBJECT
public:
    explicit EditSession(MediaEngine* engine, const MixCutSettings& settings = MixCutSettings(),
                         QObject* parent = nullptr);
    ~EditSession();

    // Synchronous probe through the engine.
    bool loadFile(const QString& filePath);
    // Installs a result obtained elsewhere (MediaLoader).
    bool applyProbeResult(const ProbeResult& result);
    void unload();

    bool isLoaded() const { return m_loaded; }
    QString filePath() const { return m_info.filePath; }
    const MediaInfo& mediaInfo() const { return m_info; }
    const KeyframeIndex& keyframeIndex() const { return m_keyframes; }
    bool fastModeAvailable() const { return m_loaded && !m_keyframes.isEmpty(); }

    TimelineModel* timeline() { return &m_timeline; }
    const TimelineModel* timeline() const { return &m_timeline; }
    AudioTrackModel* audioTracks() { return &m_audioTracks; }
    const AudioTrackModel* audioTracks() const { return &m_audioTracks; }

    const MixCutSettings& settings() const { return m_settings; }
    void setSettings(const MixCutSettings& settings) { m_settings = settings; }

    // Precise mode, default output path, normalization from the settings.
    ExportOptions defaultExportOptions() const;

    bool planCut(CutMode mode, CutPlan& out);
    bool prepareExport(const ExportOptions& options, ExportSpec& out);

    PlayheadInfo playheadInfo() const;
    // <source dir>/<base><suffix>.<ext>
    QString defaultOutputPath() const;

    MixCutError error() const { return m_errorCode; }
    QString errorString() const { return m_error; }

signals:
    void fileLoaded(const QString& filePath);
    void fileUnloaded();

private:
    bool fail(MixCutError code, const QString& message);

    MediaEngine* m_engine;
    MixCutSettings m_settings;

    bool m_loaded = false;
    MediaInfo m_info;
    KeyframeIndex m_keyframes;
    TimelineModel m_timeline;
    AudioTrackModel m_audioTracks;

    MixCutError m_errorCode = MixCutError::None;
    QString m_error;
};
