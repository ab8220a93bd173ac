#pragma once

enum class CutMode {
    Precise,    // re-encode, frame exact
    Fast        // stream copy from the keyframe at or before IN
};

// How the end of a Fast cut is aligned. Some container/codec pairs want a
// GOP-aligned end as well; the default leaves the end frame exact.
enum class EndAlignment {
    Exact,
    NextKeyframe,
    PreviousKeyframe
};

struct CutPlan {
    CutMode mode = CutMode::Precise;
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    bool requiresReencode = false;
    bool valid = false;         // default-constructed plans are never exported

    bool isValid() const { return valid && endSeconds > startSeconds; }
    double duration() const { return endSeconds - startSeconds; }

    bool operator==(const CutPlan& o) const {
        return mode == o.mode && startSeconds == o.startSeconds && endSeconds == o.endSeconds
            && requiresReencode == o.requiresReencode && valid == o.valid;
    }
    bool operator!=(const CutPlan& o) const { return !(*this == o); }
};
