#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include "ExportSpec.h"
#include "CutPlan.h"

struct MixCutSettings {
    EncoderProfile encoder;
    QString ffmpegPath;                         // empty: search
    EndAlignment endAlignment = EndAlignment::Exact;
    bool normalizeByDefault = true;
    QString outputSuffix = AppConstants::DefaultOutputSuffix;
    QString outputExtension = AppConstants::DefaultOutputExtension;
};

class MixCutConfig : public QObject {
    Q_OBJECT
public:
    explicit MixCutConfig(QObject* parent = nullptr);
    ~MixCutConfig();

    bool save(const QString& filePath, const MixCutSettings& settings);
    // Keys missing from the file keep their defaults.
    bool load(const QString& filePath, MixCutSettings& settings);

    static QJsonObject settingsToJson(const MixCutSettings& settings);
    static MixCutSettings settingsFromJson(const QJsonObject& obj);

    static QString endAlignmentToString(EndAlignment alignment);
    static EndAlignment endAlignmentFromString(const QString& text,
                                               EndAlignment fallback = EndAlignment::Exact);

    // MIXCUT_FFMPEG, then the configured path, then next to the
    // application, then PATH. Falls back to plain "ffmpeg".
    static QString resolveFfmpegPath(const MixCutSettings& settings);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
