#include "audio/silence_detector.hpp"

// Constructor
SilenceDetector::SilenceDetector(Config config) : config_(config) {}

// Resets detection variables
void SilenceDetector::reset() {
    hasSpoken_ = false;
    fired_ = false;
    timing_ = false;
    silenceStart_ = Clock::time_point{};
}

long SilenceDetector::silenceMs(Clock::time_point now) const {
    if (!timing_) return 0;
    return (long)std::chrono::duration_cast<std::chrono::milliseconds>(now - silenceStart_).count();
}

bool SilenceDetector::feed(int level, Clock::time_point now) {
    if (fired_) return false;

    if (level > config_.threshold) {
        hasSpoken_ = true;
        timing_ = false;
        return false;
    }

    if (!hasSpoken_) return false;

    if (!timing_) {
        timing_ = true;
        silenceStart_ = now;
        return false;
    }

    if (silenceMs(now) > config_.durationMs) {
        fired_ = true;
        timing_ = false;
        return true;
    }
    return false;
}
