#pragma once

#include <QObject>
#include <QString>
#include <cstdint>
#include "Rational.h"
#include "MixCutError.h"

struct TimelineState {
    double durationSeconds = 0.0;
    Rational frameRate;
    int64_t totalFrames = 0;
    int64_t currentFrame = 0;
    int64_t inFrame = 0;
    int64_t outFrame = 0;

    double frameToSeconds(int64_t frame) const;
    double inSeconds() const { return frameToSeconds(inFrame); }
    double outSeconds() const { return frameToSeconds(outFrame); }
    bool hasValidRange() const {
        return frameRate.isValid() && inFrame >= 0 && inFrame < outFrame && outFrame < totalFrames;
    }
};

// Playhead and IN/OUT selection of the loaded file, in whole frames.
// All movement is integer frame arithmetic; time is derived, never accumulated.
class TimelineModel : public QObject {
    Q_OBJECT
public:
    explicit TimelineModel(QObject* parent = nullptr);
    ~TimelineModel();

    // Initial state: playhead 0, selection covers the whole file.
    void load(double durationSeconds, const Rational& frameRate);
    void reset();
    bool isLoaded() const { return m_state.totalFrames > 0; }

    const TimelineState& state() const { return m_state; }
    int64_t totalFrames() const { return m_state.totalFrames; }
    int64_t currentFrame() const { return m_state.currentFrame; }
    int64_t inFrame() const { return m_state.inFrame; }
    int64_t outFrame() const { return m_state.outFrame; }
    double currentTime() const { return m_state.frameToSeconds(m_state.currentFrame); }

    double frameToSeconds(int64_t frame) const { return m_state.frameToSeconds(frame); }
    int64_t secondsToFrame(double seconds) const;

    void seek(int64_t frame);
    void seekToTime(double seconds);
    void stepForward();
    void stepBackward();

    // Reject with InvalidMark (state untouched) when inFrame < outFrame would break.
    bool markIn();
    bool markOut();
    void clearMarks();

    MixCutError lastError() const { return m_errorCode; }
    QString errorString() const { return m_error; }

signals:
    void currentFrameChanged(qint64 frame);
    void selectionChanged(qint64 inFrame, qint64 outFrame);

private:
    void setError(MixCutError code, const QString& message);

    TimelineState m_state;
    MixCutError m_errorCode = MixCutError::None;
    QString m_error;
};
