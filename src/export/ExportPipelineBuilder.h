#pragma once

#include <QString>
#include <vector>
#include "AudioTrackModel.h"
#include "ExportSpec.h"
#include "MixCutError.h"

struct ExportTarget {
    QString inputPath;
    QString outputPath;
    int videoStreamIndex = -1;
};

// Builds the engine-agnostic ExportSpec from a cut plan and the audio track
// states. Deterministic: identical inputs give identical specs.
class ExportPipelineBuilder {
public:
    ExportPipelineBuilder() = default;
    explicit ExportPipelineBuilder(const EncoderProfile& profile) : m_profile(profile) {}

    void setEncoderProfile(const EncoderProfile& profile) { m_profile = profile; }
    const EncoderProfile& encoderProfile() const { return m_profile; }

    bool build(const ExportTarget& target, const CutPlan& plan,
               const std::vector<AudioTrackState>& tracks, bool normalize,
               ExportSpec& out);

    static double gainToMultiplier(double gainDb);

    MixCutError error() const { return m_errorCode; }
    QString errorString() const { return m_error; }

private:
    bool fail(MixCutError code, const QString& message);

    EncoderProfile m_profile;
    MixCutError m_errorCode = MixCutError::None;
    QString m_error;
};
