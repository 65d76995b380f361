#ifndef STREAMING_TTS_PLAYER_HPP
#define STREAMING_TTS_PLAYER_HPP

#include "audio/audio_device.hpp"
#include "call/call_services.hpp"
#include "core/event_sink.hpp"
#include "tts/synthesizer.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Plays sentences in submission order while later ones are still being
// synthesized. Each speak() starts synthesis at once; one drain thread
// decodes and plays the head of the queue. stop() cancels everything without
// reporting QueueDrained.
class StreamingTtsPlayer : public SpeechService {
public:
    struct Config {
        std::string voice = "alex";
        std::string customVoiceId;
        double speed = 1.0;
        float gain = 10.0f;     // 1-20
    };

    StreamingTtsPlayer(Config config, std::shared_ptr<Synthesizer> synthesizer,
                       std::unique_ptr<AudioOutput> output, EventSink<TtsEvent>* sink);
    ~StreamingTtsPlayer() override;

    StreamingTtsPlayer(const StreamingTtsPlayer&) = delete;
    StreamingTtsPlayer& operator=(const StreamingTtsPlayer&) = delete;

    // Opens the output device; throws when it is unavailable
    void unlock() override;
    void speak(const std::string& text) override;
    void stop() override;

    bool isPlaying() const override { return playing_.load(); }
    bool isPending() const override { return pending_.load(); }

    void setGain(float gain);
    float gain() const { return gain_.load(); }
    void setVoice(const std::string& voice, const std::string& customVoiceId);
    void setSpeed(double speed);

    size_t queued() const;

private:
    struct Item {
        std::string text;
        std::shared_future<AudioBytes> audio;
    };

    std::shared_future<AudioBytes> startSynthesis(const std::string& text);
    void drain(uint64_t generation);

    Config config_;
    std::shared_ptr<Synthesizer> synthesizer_;
    std::unique_ptr<AudioOutput> output_;
    EventSink<TtsEvent>* sink_;

    mutable std::mutex mutex_;
    std::deque<Item> queue_;
    uint64_t generation_ = 0;
    bool draining_ = false;
    std::thread thread_;

    std::atomic<bool> playing_{false};
    std::atomic<bool> pending_{false};
    std::atomic<float> gain_{10.0f};
};

#endif
