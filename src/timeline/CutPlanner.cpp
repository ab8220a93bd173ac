#include "CutPlanner.h"
#include "Logging.h"
#include "TimeUtil.h"

bool CutPlanner::plan(const TimelineState& timeline, const KeyframeIndex& keyframes,
                      CutMode mode, CutPlan& out) {
    out = CutPlan{};
    m_errorCode = MixCutError::None;
    m_error.clear();

    if (!timeline.frameRate.isValid()) {
        return fail(MixCutError::InvalidRange, "Timeline has no valid frame rate");
    }
    if (timeline.inFrame < 0 || timeline.inFrame >= timeline.outFrame) {
        return fail(MixCutError::InvalidRange,
                    QString("Invalid selection: IN %1, OUT %2")
                        .arg(timeline.inFrame).arg(timeline.outFrame));
    }

    const double inSeconds = timeline.inSeconds();
    const double outSeconds = timeline.outSeconds();

    CutPlan plan;
    plan.mode = mode;
    plan.endSeconds = outSeconds;

    if (mode == CutMode::Precise) {
        plan.startSeconds = inSeconds;
        plan.requiresReencode = true;
    } else {
        if (keyframes.isEmpty()) {
            return fail(MixCutError::EmptyIndex, "No keyframes known: fast cut unavailable");
        }
        // A keyframe on the IN frame itself must not lose to float noise and
        // widen the window to the previous GOP. Never look further ahead.
        auto keyframe = keyframes.nearestAtOrBefore(inSeconds + TimeUtil::FrameEpsilon);
        plan.startSeconds = keyframe ? *keyframe : 0.0;
        plan.requiresReencode = false;
        plan.endSeconds = alignEnd(outSeconds, plan.startSeconds,
                                   timeline.durationSeconds, keyframes);

        qCDebug(mixcutPlan, "fast cut: IN %.6f s snapped to %.6f s, OUT %.6f s -> %.6f s",
                inSeconds, plan.startSeconds, outSeconds, plan.endSeconds);
    }

    plan.valid = true;
    out = plan;
    return true;
}

double CutPlanner::alignEnd(double endSeconds, double startSeconds, double durationSeconds,
                            const KeyframeIndex& keyframes) const {
    switch (m_endAlignment) {
    case EndAlignment::Exact:
        return endSeconds;
    case EndAlignment::NextKeyframe: {
        auto next = keyframes.nearestAtOrAfter(endSeconds);
        if (next) return *next;
        return durationSeconds > endSeconds ? durationSeconds : endSeconds;
    }
    case EndAlignment::PreviousKeyframe: {
        auto previous = keyframes.nearestAtOrBefore(endSeconds);
        if (previous && *previous > startSeconds) return *previous;
        return endSeconds;
    }
    }
    return endSeconds;
}

bool CutPlanner::fail(MixCutError code, const QString& message) {
    m_errorCode = code;
    m_error = message;
    qCWarning(mixcutPlan, "%s: %s", qPrintable(mixCutErrorName(code)), qPrintable(message));
    return false;
}
