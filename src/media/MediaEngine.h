#pragma once

#include <QMetaType>
#include <QString>
#include <atomic>
#include <functional>
#include "MediaInfo.h"
#include "ExportSpec.h"
#include "MixCutError.h"

struct ProbeResult {
    bool ok = false;
    MediaInfo info;
    QString error;
};

enum class ExecutionStatus {
    Success,
    Failed,         // clean exit with a non-zero code
    Crashed,        // engine died (signal, abort)
    OutputInvalid,  // exit code 0 but no usable output file
    StartFailed,    // engine missing or not executable
    Cancelled
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Failed;
    QString outputPath;
    int exitCode = 0;
    QString stderrText;

    bool ok() const { return status == ExecutionStatus::Success; }
    MixCutError error() const {
        if (status == ExecutionStatus::Success) return MixCutError::None;
        if (status == ExecutionStatus::Cancelled) return MixCutError::Cancelled;
        return MixCutError::ExecutionFailure;
    }
};

using ProgressCallback = std::function<void(double fraction)>;

// The only door to external media tooling. Probing and execution may block
// for a long time; callers run them off the interactive thread.
class MediaEngine {
public:
    virtual ~MediaEngine() = default;

    virtual ProbeResult probe(const QString& filePath) = 0;
    virtual ExecutionResult execute(const ExportSpec& spec,
                                    const std::atomic<bool>& cancelRequested,
                                    const ProgressCallback& progress) = 0;
};

Q_DECLARE_METATYPE(ProbeResult)
Q_DECLARE_METATYPE(ExecutionResult)
