#ifndef VAD_BACKEND_HPP
#define VAD_BACKEND_HPP

#include "audio/audio_device.hpp"
#include "audio/pcm_ring_buffer.hpp"
#include "audio/resampler.hpp"
#include "core/call_events.hpp"
#include "core/event_sink.hpp"
#include "vad/keyword_gate.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Speech detector over its own microphone stream. Subclasses see 16 kHz mono
// PCM in process() and report raw speech boundaries; this class applies the
// ignore window and, in KeywordGated mode, holds SpeechStart back until the
// utterance has been verified against the interrupt words.
class VadBackend {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        int ignoreMs = 800;
    };

    VadBackend(std::string name, Config config, AudioInputFactory inputFactory,
               EventSink<VadEvent>* sink, KeywordGate* gate);
    virtual ~VadBackend();

    VadBackend(const VadBackend&) = delete;
    VadBackend& operator=(const VadBackend&) = delete;

    // Throws std::runtime_error when the device or backend cannot start.
    // Restarts when already active.
    void start(VadMode mode);
    void stop();

    bool isActive() const { return active_.load(); }
    bool isSpeaking() const { return speaking_.load(); }
    VadStatus status() const { return status_.load(); }
    VadMode mode() const { return mode_; }
    bool gated() const { return gated_.load(); }
    const std::string& name() const { return name_; }

    void setIgnoreMs(int ms) { config_.ignoreMs = ms; }

    // Capture-thread entry; also driven directly by tests
    void onFrames(const int16_t* samples, int frames, Clock::time_point now);

protected:
    // Runs before the microphone opens; may throw
    virtual void startBackend() {}
    virtual void stopBackend() {}
    virtual void process(const int16_t* pcm16k, size_t n, Clock::time_point now) = 0;

    // False when the backend reports Active itself once its handshake is done
    virtual bool activeOnStart() const { return true; }

    void armIgnoreWindow(Clock::time_point now);
    bool inIgnoreWindow(Clock::time_point now) const;

    void reportSpeechStart(Clock::time_point now);
    void reportSpeechEnd(Clock::time_point now);

    void setStatus(VadStatus status);
    void emit(const VadEvent& event);

    // Derived destructors call this so stopBackend() still dispatches virtually
    void shutdown();

private:
    std::string name_;
    Config config_;
    AudioInputFactory inputFactory_;
    EventSink<VadEvent>* sink_;
    KeywordGate* gate_;

    std::unique_ptr<AudioInput> input_;
    std::unique_ptr<Resampler> resampler_;
    PcmRingBuffer preRoll_;

    VadMode mode_ = VadMode::Direct;
    std::atomic<bool> active_{false};
    std::atomic<bool> speaking_{false};
    std::atomic<bool> gated_{false};
    std::atomic<VadStatus> status_{VadStatus::Stopped};
    std::atomic<int64_t> ignoreUntilMs_{0};

    std::mutex speechMutex_;
    Clock::time_point speechStartedAt_{};

    // Bumped on every start/stop and on destruction; a verification result
    // from an older generation is discarded. Shared with the pending gate
    // callbacks so they can outlive the backend.
    struct GateState {
        std::mutex mutex;
        uint64_t generation = 0;
    };
    std::shared_ptr<GateState> gateState_;

    void nextGeneration();
};

#endif
