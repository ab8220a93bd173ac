#pragma once

#include <QString>
#include <optional>
#include <vector>
#include "MixCutError.h"

// Sorted keyframe timestamps (seconds) of one video stream.
// Read-only once built; lookups are binary searches.
class KeyframeIndex {
public:
    KeyframeIndex() = default;

    // Sorts, de-duplicates and drops negative or non-finite entries.
    // Fails with EmptyIndex when nothing usable remains.
    bool build(std::vector<double> timestamps);
    void clear();

    std::optional<double> nearestAtOrBefore(double t) const;
    std::optional<double> nearestAtOrAfter(double t) const;

    // Closest keyframe on either side; a tie goes to the later one.
    std::optional<double> nearest(double t) const;

    bool isEmpty() const { return m_timestamps.empty(); }
    int size() const { return static_cast<int>(m_timestamps.size()); }
    const std::vector<double>& timestamps() const { return m_timestamps; }

    MixCutError error() const { return m_errorCode; }
    QString errorString() const { return m_error; }

private:
    std::vector<double> m_timestamps;
    MixCutError m_errorCode = MixCutError::None;
    QString m_error;
};
