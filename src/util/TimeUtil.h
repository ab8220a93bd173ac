#pragma once

#include <cmath>
#include <cstdint>
#include <QString>
#include <QRegularExpression>
#include "Rational.h"

namespace TimeUtil {

// Tolerance for frame arithmetic on values that went through a double.
inline constexpr double FrameEpsilon = 1e-6;

inline double frameToSeconds(int64_t frame, const Rational& rate) {
    if (!rate.isValid()) return 0.0;
    return static_cast<double>(frame) * rate.den / rate.num;
}

// Frame containing the given time (floor), tolerant of float noise just below a boundary.
inline int64_t secondsToFrame(double seconds, const Rational& rate) {
    if (!rate.isValid() || !(seconds > 0.0)) return 0;
    return static_cast<int64_t>(std::floor(seconds * rate.num / rate.den + FrameEpsilon));
}

inline QString secondsToHMSms(double totalSeconds) {
    if (totalSeconds < 0.0) totalSeconds = 0.0;
    int64_t totalMillis = static_cast<int64_t>(std::llround(totalSeconds * 1000.0));
    int hours = static_cast<int>(totalMillis / 3600000);
    int minutes = static_cast<int>((totalMillis / 60000) % 60);
    int seconds = static_cast<int>((totalMillis / 1000) % 60);
    int millis = static_cast<int>(totalMillis % 1000);

    return QString("%1:%2:%3.%4")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

// MM:SS.cc readout used next to the timeline.
inline QString secondsToMMSS(double totalSeconds) {
    if (totalSeconds < 0.0) totalSeconds = 0.0;
    int64_t totalCentis = static_cast<int64_t>(std::llround(totalSeconds * 100.0));
    int minutes = static_cast<int>(totalCentis / 6000);
    int seconds = static_cast<int>((totalCentis / 100) % 60);
    int centis = static_cast<int>(totalCentis % 100);
    return QString("%1:%2.%3")
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(centis, 2, 10, QChar('0'));
}

// Seek/trim argument for ffmpeg: plain seconds, microsecond precision.
inline QString secondsToFfmpegTime(double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    return QString::number(seconds, 'f', 6);
}

// Parses "HH:MM:SS.xx"; returns false on anything else.
inline bool parseHMS(const QString& text, double& seconds) {
    static const QRegularExpression re(R"(^(\d+):(\d{1,2}):(\d{1,2}(?:\.\d+)?)$)");
    auto match = re.match(text.trimmed());
    if (!match.hasMatch()) return false;
    seconds = match.captured(1).toDouble() * 3600.0
            + match.captured(2).toDouble() * 60.0
            + match.captured(3).toDouble();
    return true;
}

} // namespace TimeUtil
