#include "EditSession.h"
#include "CutPlanner.h"
#include "ExportPipelineBuilder.h"
#include "Logging.h"
#include <QDir>
#include <QFileInfo>

EditSession::EditSession(MediaEngine* engine, const MixCutSettings& settings, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_settings(settings)
{}

EditSession::~EditSession() = default;

bool EditSession::loadFile(const QString& filePath) {
    if (!m_engine) {
        unload();
        return fail(MixCutError::ProbeFailed, "No media engine");
    }
    return applyProbeResult(m_engine->probe(filePath));
}

bool EditSession::applyProbeResult(const ProbeResult& result) {
    unload();

    if (!result.ok) {
        return fail(MixCutError::ProbeFailed,
                    result.error.isEmpty() ? QString("Cannot probe %1").arg(result.info.filePath)
                                           : result.error);
    }
    const StreamInfo* video = result.info.videoStream();
    if (!video) {
        return fail(MixCutError::ProbeFailed,
                    QString("No video stream in %1").arg(result.info.filePath));
    }
    if (!video->frameRate.isValid()) {
        return fail(MixCutError::ProbeFailed,
                    QString("Video stream %1 has no usable frame rate").arg(video->streamIndex));
    }

    m_info = result.info;
    const double duration = m_info.durationSeconds > 0.0 ? m_info.durationSeconds
                                                         : video->durationSeconds;

    if (!m_keyframes.build(m_info.keyframeTimestamps)) {
        qCWarning(mixcutSession, "%s: %s, only precise cuts possible",
                  qPrintable(m_info.filePath), qPrintable(m_keyframes.errorString()));
    }
    m_timeline.load(duration, video->frameRate);
    m_audioTracks.load(m_info.audioStreams());
    m_loaded = true;
    m_errorCode = MixCutError::None;
    m_error.clear();

    qCInfo(mixcutSession, "loaded %s: %lld frames at %d/%d, %d keyframes, %d audio track(s)",
           qPrintable(m_info.filePath), static_cast<long long>(m_timeline.totalFrames()),
           video->frameRate.num, video->frameRate.den, m_keyframes.size(),
           m_audioTracks.trackCount());
    emit fileLoaded(m_info.filePath);
    return true;
}

void EditSession::unload() {
    const bool wasLoaded = m_loaded;
    m_loaded = false;
    m_info = MediaInfo{};
    m_keyframes.clear();
    m_timeline.reset();
    m_audioTracks.clear();
    if (wasLoaded) emit fileUnloaded();
}

bool EditSession::planCut(CutMode mode, CutPlan& out) {
    out = CutPlan{};
    if (!m_loaded) {
        return fail(MixCutError::NoActiveTimeline, "No file loaded");
    }
    CutPlanner planner(m_settings.endAlignment);
    if (!planner.plan(m_timeline.state(), m_keyframes, mode, out)) {
        return fail(planner.error(), planner.errorString());
    }
    m_errorCode = MixCutError::None;
    m_error.clear();
    return true;
}

bool EditSession::prepareExport(const ExportOptions& options, ExportSpec& out) {
    out = ExportSpec{};
    CutPlan plan;
    if (!planCut(options.mode, plan)) {
        return false;
    }

    ExportTarget target;
    target.inputPath = m_info.filePath;
    target.outputPath = options.outputPath.isEmpty() ? defaultOutputPath() : options.outputPath;
    target.videoStreamIndex = m_info.videoStreamIndex;

    ExportPipelineBuilder builder(m_settings.encoder);
    if (!builder.build(target, plan, m_audioTracks.snapshot(), options.normalize, out)) {
        return fail(builder.error(), builder.errorString());
    }
    return true;
}

ExportOptions EditSession::defaultExportOptions() const {
    ExportOptions options;
    options.outputPath = defaultOutputPath();
    options.normalize = m_settings.normalizeByDefault;
    return options;
}

PlayheadInfo EditSession::playheadInfo() const {
    PlayheadInfo info;
    if (!m_loaded) return info;
    info.currentFrame = m_timeline.currentFrame();
    info.totalFrames = m_timeline.totalFrames();
    auto keyframe = m_keyframes.nearest(m_timeline.currentTime());
    if (keyframe) {
        info.nearestKeyframeFrame = m_timeline.secondsToFrame(*keyframe);
    }
    return info;
}

QString EditSession::defaultOutputPath() const {
    if (m_info.filePath.isEmpty()) return QString();
    QFileInfo source(m_info.filePath);
    return source.dir().filePath(QString("%1%2.%3")
        .arg(source.completeBaseName(), m_settings.outputSuffix, m_settings.outputExtension));
}

bool EditSession::fail(MixCutError code, const QString& message) {
    m_errorCode = code;
    m_error = message;
    qCWarning(mixcutSession, "%s: %s", qPrintable(mixCutErrorName(code)), qPrintable(message));
    return false;
}
