#pragma once

#include <QString>

enum class MixCutError {
    None,
    ProbeFailed,        // engine missing, unreadable input, unparseable output
    EmptyIndex,         // no keyframes: Fast mode unavailable
    InvalidRange,       // inFrame >= outFrame
    InvalidMark,        // mark would break inFrame < outFrame
    GainOutOfRange,     // enabled track outside [-30, 30] dB
    NoActiveTimeline,   // export requested without a valid cut plan
    InvalidOutputPath,
    ExecutionFailure,
    Cancelled
};

inline QString mixCutErrorName(MixCutError error) {
    switch (error) {
    case MixCutError::None:              return QStringLiteral("None");
    case MixCutError::ProbeFailed:       return QStringLiteral("ProbeFailed");
    case MixCutError::EmptyIndex:        return QStringLiteral("EmptyIndex");
    case MixCutError::InvalidRange:      return QStringLiteral("InvalidRange");
    case MixCutError::InvalidMark:       return QStringLiteral("InvalidMark");
    case MixCutError::GainOutOfRange:    return QStringLiteral("GainOutOfRange");
    case MixCutError::NoActiveTimeline:  return QStringLiteral("NoActiveTimeline");
    case MixCutError::InvalidOutputPath: return QStringLiteral("InvalidOutputPath");
    case MixCutError::ExecutionFailure:  return QStringLiteral("ExecutionFailure");
    case MixCutError::Cancelled:         return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}
