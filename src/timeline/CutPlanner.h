#pragma once

#include <QString>
#include "CutPlan.h"
#include "KeyframeIndex.h"
#include "TimelineModel.h"
#include "MixCutError.h"

// Turns the IN/OUT selection into trim bounds. plan() is a pure function of
// its arguments and the end alignment setting.
class CutPlanner {
public:
    CutPlanner() = default;
    explicit CutPlanner(EndAlignment endAlignment) : m_endAlignment(endAlignment) {}

    void setEndAlignment(EndAlignment alignment) { m_endAlignment = alignment; }
    EndAlignment endAlignment() const { return m_endAlignment; }

    bool plan(const TimelineState& timeline, const KeyframeIndex& keyframes,
              CutMode mode, CutPlan& out);

    MixCutError error() const { return m_errorCode; }
    QString errorString() const { return m_error; }

private:
    double alignEnd(double endSeconds, double startSeconds, double durationSeconds,
                    const KeyframeIndex& keyframes) const;
    bool fail(MixCutError code, const QString& message);

    EndAlignment m_endAlignment = EndAlignment::Exact;
    MixCutError m_errorCode = MixCutError::None;
    QString m_error;
};
