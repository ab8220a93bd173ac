#include "KeyframeIndex.h"
#include <algorithm>
#include <cmath>

bool KeyframeIndex::build(std::vector<double> timestamps) {
    timestamps.erase(std::remove_if(timestamps.begin(), timestamps.end(),
                                    [](double t) { return !std::isfinite(t) || t < 0.0; }),
                     timestamps.end());
    std::sort(timestamps.begin(), timestamps.end());
    timestamps.erase(std::unique(timestamps.begin(), timestamps.end()), timestamps.end());

    m_timestamps = std::move(timestamps);
    if (m_timestamps.empty()) {
        m_errorCode = MixCutError::EmptyIndex;
        m_error = "Video stream reports no keyframes";
        return false;
    }
    m_errorCode = MixCutError::None;
    m_error.clear();
    return true;
}

void KeyframeIndex::clear() {
    m_timestamps.clear();
    m_errorCode = MixCutError::None;
    m_error.clear();
}

std::optional<double> KeyframeIndex::nearestAtOrBefore(double t) const {
    auto it = std::upper_bound(m_timestamps.begin(), m_timestamps.end(), t);
    if (it == m_timestamps.begin()) return std::nullopt;
    return *(it - 1);
}

std::optional<double> KeyframeIndex::nearestAtOrAfter(double t) const {
    auto it = std::lower_bound(m_timestamps.begin(), m_timestamps.end(), t);
    if (it == m_timestamps.end()) return std::nullopt;
    return *it;
}

std::optional<double> KeyframeIndex::nearest(double t) const {
    auto before = nearestAtOrBefore(t);
    auto after = nearestAtOrAfter(t);
    if (!before) return after;
    if (!after) return before;
    return (t - *before < *after - t) ? before : after;
}
