#include "TimelineModel.h"
#include "TimeUtil.h"
#include <algorithm>

double TimelineState::frameToSeconds(int64_t frame) const {
    return TimeUtil::frameToSeconds(frame, frameRate);
}

TimelineModel::TimelineModel(QObject* parent) : QObject(parent) {}
TimelineModel::~TimelineModel() = default;

void TimelineModel::load(double durationSeconds, const Rational& frameRate) {
    m_state = TimelineState{};
    m_state.durationSeconds = std::max(0.0, durationSeconds);
    m_state.frameRate = frameRate;
    if (frameRate.isValid()) {
        m_state.totalFrames = std::max<int64_t>(1, TimeUtil::secondsToFrame(m_state.durationSeconds, frameRate));
    }
    m_state.outFrame = std::max<int64_t>(0, m_state.totalFrames - 1);
    m_errorCode = MixCutError::None;
    m_error.clear();

    emit currentFrameChanged(m_state.currentFrame);
    emit selectionChanged(m_state.inFrame, m_state.outFrame);
}

void TimelineModel::reset() {
    m_state = TimelineState{};
    m_errorCode = MixCutError::None;
    m_error.clear();
    emit currentFrameChanged(0);
    emit selectionChanged(0, 0);
}

int64_t TimelineModel::secondsToFrame(double seconds) const {
    return TimeUtil::secondsToFrame(seconds, m_state.frameRate);
}

void TimelineModel::seek(int64_t frame) {
    if (!isLoaded()) return;
    frame = std::clamp<int64_t>(frame, 0, m_state.totalFrames - 1);
    if (frame != m_state.currentFrame) {
        m_state.currentFrame = frame;
        emit currentFrameChanged(frame);
    }
}

void TimelineModel::seekToTime(double seconds) {
    seek(secondsToFrame(seconds));
}

void TimelineModel::stepForward() {
    seek(m_state.currentFrame + 1);
}

void TimelineModel::stepBackward() {
    seek(m_state.currentFrame - 1);
}

bool TimelineModel::markIn() {
    if (!isLoaded()) {
        setError(MixCutError::InvalidMark, "No file loaded");
        return false;
    }
    if (m_state.currentFrame >= m_state.outFrame) {
        setError(MixCutError::InvalidMark,
                 QString("IN point %1 must precede OUT point %2")
                     .arg(m_state.currentFrame).arg(m_state.outFrame));
        return false;
    }
    m_state.inFrame = m_state.currentFrame;
    m_errorCode = MixCutError::None;
    m_error.clear();
    emit selectionChanged(m_state.inFrame, m_state.outFrame);
    return true;
}

bool TimelineModel::markOut() {
    if (!isLoaded()) {
        setError(MixCutError::InvalidMark, "No file loaded");
        return false;
    }
    if (m_state.currentFrame <= m_state.inFrame) {
        setError(MixCutError::InvalidMark,
                 QString("OUT point %1 must follow IN point %2")
                     .arg(m_state.currentFrame).arg(m_state.inFrame));
        return false;
    }
    m_state.outFrame = m_state.currentFrame;
    m_errorCode = MixCutError::None;
    m_error.clear();
    emit selectionChanged(m_state.inFrame, m_state.outFrame);
    return true;
}

void TimelineModel::clearMarks() {
    if (!isLoaded()) return;
    m_state.inFrame = 0;
    m_state.outFrame = m_state.totalFrames - 1;
    emit selectionChanged(m_state.inFrame, m_state.outFrame);
}

void TimelineModel::setError(MixCutError code, const QString& message) {
    m_errorCode = code;
    m_error = message;
}
