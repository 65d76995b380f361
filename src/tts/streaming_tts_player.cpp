#include "tts/streaming_tts_player.hpp"
#include "tts/http_synthesizer.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace {
std::string preview(const std::string& text) {
    return text.size() > 30 ? text.substr(0, 30) + "..." : text;
}
}  // namespace

// Constructor
StreamingTtsPlayer::StreamingTtsPlayer(Config config, std::shared_ptr<Synthesizer> synthesizer,
                                       std::unique_ptr<AudioOutput> output, EventSink<TtsEvent>* sink)
    : config_(std::move(config)),
      synthesizer_(std::move(synthesizer)),
      output_(std::move(output)),
      sink_(sink) {
    setGain(config_.gain);
}

// Destructor
StreamingTtsPlayer::~StreamingTtsPlayer() {
    stop();
    if (output_) output_->close();
}

void StreamingTtsPlayer::unlock() {
    output_->open();
    std::cout << "[TTS] Audio unlocked" << std::endl;
}

void StreamingTtsPlayer::setGain(float gain) {
    gain_ = std::max(1.0f, std::min(20.0f, gain));
}

void StreamingTtsPlayer::setVoice(const std::string& voice, const std::string& customVoiceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.voice = voice;
    config_.customVoiceId = customVoiceId;
}

void StreamingTtsPlayer::setSpeed(double speed) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.speed = HttpSynthesizer::clampSpeed(speed);
}

size_t StreamingTtsPlayer::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// Synthesis runs detached so an abandoned result never blocks the caller
std::shared_future<AudioBytes> StreamingTtsPlayer::startSynthesis(const std::string& text) {
    SynthesisRequest request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request.text = text;
        request.voice = config_.voice;
        request.customVoiceId = config_.customVoiceId;
        request.speed = config_.speed;
    }

    auto promise = std::make_shared<std::promise<AudioBytes>>();
    std::shared_future<AudioBytes> future = promise->get_future().share();
    std::shared_ptr<Synthesizer> synthesizer = synthesizer_;

    std::cout << "[TTS] Synthesizing \"" << preview(text) << "\" voice=" << request.voice
              << ", speed=" << request.speed << std::endl;

    std::thread([promise, synthesizer, request] {
        try {
            promise->set_value(synthesizer->synthesize(request));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return future;
}

void StreamingTtsPlayer::speak(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) return;

    Item item{text, startSynthesis(text)};

    bool startThread = false;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(item));
        pending_ = true;
        generation = generation_;
        if (!draining_) {
            draining_ = true;
            startThread = true;
        }
    }

    if (startThread) {
        if (thread_.joinable()) thread_.join();
        thread_ = std::thread(&StreamingTtsPlayer::drain, this, generation);
    }
}

void StreamingTtsPlayer::stop() {
    size_t dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        dropped = queue_.size();
        queue_.clear();
        pending_ = false;
    }
    if (output_) output_->stop();
    if (thread_.joinable()) thread_.join();
    playing_ = false;

    if (dropped) std::cout << "[TTS] Stopped, " << dropped << " queued sentence(s) dropped" << std::endl;
}

void StreamingTtsPlayer::drain(uint64_t generation) {
    while (true) {
        Item item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) {
                draining_ = false;
                break;
            }
            if (queue_.empty()) {
                draining_ = false;
                pending_ = false;
                // Under the lock: nothing is reported once stop() bumped the generation
                std::cout << "[TTS] Queue drained" << std::endl;
                if (sink_) sink_->emit(TtsEvent{TtsEvent::Kind::QueueDrained, {}});
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
        }

        bool cancelled = false;
        while (item.audio.wait_for(std::chrono::milliseconds(20)) != std::future_status::ready) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) {
                cancelled = true;
                break;
            }
        }
        if (cancelled) continue;

        PcmAudio pcm;
        try {
            pcm = decodeWav(item.audio.get());
        } catch (const std::exception& e) {
            std::cerr << "[TTS] [WARN] Skipping \"" << preview(item.text) << "\": " << e.what() << std::endl;
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) continue;
            output_->resume();
            playing_ = true;
        }

        if (sink_) sink_->emit(TtsEvent{TtsEvent::Kind::PlaybackStarted, item.text});
        std::cout << "[TTS] Playing " << pcm.durationSeconds() << "s" << std::endl;

        try {
            output_->play(pcm, gain_.load());
        } catch (const std::exception& e) {
            std::cerr << "[TTS] [ERROR] Playback failed: " << e.what() << std::endl;
        }
        playing_ = false;
    }
}
