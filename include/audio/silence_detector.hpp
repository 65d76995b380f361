#ifndef SILENCE_DETECTOR_HPP
#define SILENCE_DETECTOR_HPP

#include <chrono>

// End-of-utterance detection on AudioLevel frames.
//
// Phase 1 waits for one frame above the threshold. Recordings that never get
// there never auto-stop, so background hiss cannot end a turn.
// Phase 2 starts a timer when the level falls to or below the threshold,
// resets it on any louder frame, and fires once the timer exceeds durationMs.
class SilenceDetector {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        int threshold = 30;        // AudioLevel 0-255
        int durationMs = 1500;
    };

    explicit SilenceDetector(Config config);

    // Returns true on the single frame that completes the silence
    bool feed(int level, Clock::time_point now);

    bool hasSpoken() const { return hasSpoken_; }
    bool fired() const { return fired_; }

    // Milliseconds of the running silence timer, 0 when not timing
    long silenceMs(Clock::time_point now) const;

    void setConfig(Config config) { config_ = config; }
    const Config& config() const { return config_; }

    void reset();

private:
    Config config_;

    bool hasSpoken_ = false;
    bool fired_ = false;
    bool timing_ = false;
    Clock::time_point silenceStart_{};
};

#endif
