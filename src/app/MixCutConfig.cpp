#include "MixCutConfig.h"
#include "Logging.h"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QStandardPaths>

MixCutConfig::MixCutConfig(QObject* parent) : QObject(parent) {}
MixCutConfig::~MixCutConfig() = default;

bool MixCutConfig::save(const QString& filePath, const MixCutSettings& settings) {
    QJsonObject root;
    root["version"] = 1;
    root["settings"] = settingsToJson(settings);

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return true;
}

bool MixCutConfig::load(const QString& filePath, MixCutSettings& settings) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_error = QString("Invalid config format: %1").arg(parseError.errorString());
        return false;
    }

    settings = settingsFromJson(doc.object()["settings"].toObject());
    return true;
}

QJsonObject MixCutConfig::settingsToJson(const MixCutSettings& settings) {
    QJsonObject video;
    video["codec"] = settings.encoder.video.codec;
    video["crf"] = settings.encoder.video.crf;
    video["preset"] = settings.encoder.video.preset;

    QJsonObject audio;
    audio["codec"] = settings.encoder.audio.codec;
    audio["bitrate"] = settings.encoder.audio.bitrate;

    QJsonObject obj;
    obj["video"] = video;
    obj["audio"] = audio;
    obj["ffmpegPath"] = settings.ffmpegPath;
    obj["endAlignment"] = endAlignmentToString(settings.endAlignment);
    obj["normalizeByDefault"] = settings.normalizeByDefault;
    obj["outputSuffix"] = settings.outputSuffix;
    obj["outputExtension"] = settings.outputExtension;
    return obj;
}

MixCutSettings MixCutConfig::settingsFromJson(const QJsonObject& obj) {
    MixCutSettings s;
    const QJsonObject video = obj["video"].toObject();
    s.encoder.video.codec = video["codec"].toString(s.encoder.video.codec);
    s.encoder.video.crf = video["crf"].toInt(s.encoder.video.crf);
    s.encoder.video.preset = video["preset"].toString(s.encoder.video.preset);

    const QJsonObject audio = obj["audio"].toObject();
    s.encoder.audio.codec = audio["codec"].toString(s.encoder.audio.codec);
    s.encoder.audio.bitrate = audio["bitrate"].toInt(s.encoder.audio.bitrate);

    s.ffmpegPath = obj["ffmpegPath"].toString();
    s.endAlignment = endAlignmentFromString(obj["endAlignment"].toString());
    s.normalizeByDefault = obj["normalizeByDefault"].toBool(s.normalizeByDefault);
    s.outputSuffix = obj["outputSuffix"].toString(s.outputSuffix);
    s.outputExtension = obj["outputExtension"].toString(s.outputExtension);
    return s;
}

QString MixCutConfig::endAlignmentToString(EndAlignment alignment) {
    switch (alignment) {
    case EndAlignment::Exact:            return "exact";
    case EndAlignment::NextKeyframe:     return "nextKeyframe";
    case EndAlignment::PreviousKeyframe: return "previousKeyframe";
    }
    return "exact";
}

EndAlignment MixCutConfig::endAlignmentFromString(const QString& text, EndAlignment fallback) {
    if (text == "exact") return EndAlignment::Exact;
    if (text == "nextKeyframe") return EndAlignment::NextKeyframe;
    if (text == "previousKeyframe") return EndAlignment::PreviousKeyframe;
    return fallback;
}

QString MixCutConfig::resolveFfmpegPath(const MixCutSettings& settings) {
    const QString fromEnv = qEnvironmentVariable(AppConstants::FfmpegEnvVar);
    if (!fromEnv.isEmpty()) return fromEnv;

    if (!settings.ffmpegPath.isEmpty() && QFileInfo(settings.ffmpegPath).isExecutable()) {
        return settings.ffmpegPath;
    }

    if (QCoreApplication::instance()) {
        const QString bundled = QDir(QCoreApplication::applicationDirPath()).filePath("ffmpeg");
        if (QFileInfo(bundled).isExecutable()) return bundled;
    }

    const QString onPath = QStandardPaths::findExecutable("ffmpeg");
    if (!onPath.isEmpty()) return onPath;

    qCWarning(mixcutSession, "ffmpeg not found; relying on the process search path");
    return QStringLiteral("ffmpeg");
}
