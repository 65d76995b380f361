#include "audio/audio_recorder.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace {
SpectrumAnalyzer::Config analyzerConfig(int fftSize) {
    SpectrumAnalyzer::Config c;
    c.fftSize = fftSize;
    return c;
}
}  // namespace

// Constructor
AudioRecorder::AudioRecorder(Config config, AudioInputFactory inputFactory, EventSink<RecorderEvent>* sink)
    : config_(config),
      inputFactory_(std::move(inputFactory)),
      sink_(sink),
      analyzer_(analyzerConfig(config.fftSize)),
      silence_(SilenceDetector::Config{config.silenceThreshold, config.silenceDurationMs}) {}

// Destructor
AudioRecorder::~AudioRecorder() {
    finishWatch();
    if (input_) input_->stop();
}

void AudioRecorder::setConfig(Config config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    silence_.setConfig(SilenceDetector::Config{config.silenceThreshold, config.silenceDurationMs});
}

// Acquires a microphone stream and starts buffering
void AudioRecorder::startRecording() {
    if (recording_.load()) return;

    std::unique_ptr<AudioInput> input = inputFactory_();
    if (!input) throw std::runtime_error("AudioRecorder: no input device");

    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.clear();
        analyzer_.reset();
        silence_.reset();
        reported_ = false;
        startedAt_ = std::chrono::steady_clock::now();
        lastLog_ = startedAt_;
        sampleRate_ = input->sampleRate();
        deadline = startedAt_ + std::chrono::milliseconds(config_.maxRecordingMs);
        recording_ = true;
    }

    try {
        input->start([this](const int16_t* samples, int frames) {
            onFrames(samples, frames, std::chrono::steady_clock::now());
        }, [this](const std::string& error) {
            onInputError(error);
        });
    } catch (...) {
        recording_ = false;
        throw;
    }

    input_ = std::move(input);
    watchdog_ = std::thread(&AudioRecorder::watch, this, deadline);
    std::cout << "[Recorder] Recording started" << std::endl;
}

// Finalizes the WAV container and releases the stream
AudioBytes AudioRecorder::stopRecording() {
    if (!recording_.load() || !input_) throw std::runtime_error("AudioRecorder: not recording");

    finishWatch();
    input_->stop();
    input_.reset();

    std::vector<int16_t> pcm;
    int rate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pcm.swap(samples_);
        rate = sampleRate_;
    }
    cleanup();

    std::cout << "[Recorder] Recording stopped, " << pcm.size() << " samples" << std::endl;
    return encodeWav(pcm, rate, 1);
}

// Clears recording_ under the lock so the watchdog cannot miss the wakeup
void AudioRecorder::finishWatch() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recording_ = false;
    }
    watchCv_.notify_all();
    if (watchdog_.joinable()) watchdog_.join();
}

void AudioRecorder::watch(std::chrono::steady_clock::time_point deadline) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (watchCv_.wait_until(lock, deadline, [this] { return !recording_.load() || reported_; })) return;
        reported_ = true;
    }
    std::cout << "[Recorder] [WARN] Max recording length reached" << std::endl;
    if (sink_) sink_->emit(RecorderEvent{RecorderEvent::Kind::SilenceDetected, {}});
}

void AudioRecorder::onInputError(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!recording_.load() || reported_) return;
        reported_ = true;
    }
    watchCv_.notify_all();
    std::cerr << "[Recorder] [ERROR] Input lost: " << error << std::endl;
    if (sink_) sink_->emit(RecorderEvent{RecorderEvent::Kind::InputFailed, error});
}

void AudioRecorder::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = 0;
    analyzer_.reset();
    silence_.reset();
    reported_ = false;
}

void AudioRecorder::onFrames(const int16_t* samples, int frames, std::chrono::steady_clock::time_point now) {
    if (!recording_.load()) return;

    bool fire = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.insert(samples_.end(), samples, samples + frames);

        analyzer_.push(samples, frames);
        analyzer_.analyze();
        const int level = analyzer_.level();
        level_ = level;

        if (now - lastLog_ > std::chrono::seconds(1)) {
            std::cout << "[Recorder] level " << level << ", threshold " << config_.silenceThreshold
                      << ", spoken " << (silence_.hasSpoken() ? "yes" : "no")
                      << ", silence " << silence_.silenceMs(now) << "ms" << std::endl;
            lastLog_ = now;
        }

        if (!reported_) {
            const bool wasSpoken = silence_.hasSpoken();
            if (silence_.feed(level, now)) {
                std::cout << "[Recorder] Silence detected, end of utterance" << std::endl;
                fire = true;
            } else if (!wasSpoken && silence_.hasSpoken()) {
                std::cout << "[Recorder] Speech started" << std::endl;
            }

            if (!fire && now - startedAt_ >= std::chrono::milliseconds(config_.maxRecordingMs)) {
                std::cout << "[Recorder] [WARN] Max recording length reached" << std::endl;
                fire = true;
            }
            if (fire) reported_ = true;
        }
    }

    if (fire) {
        watchCv_.notify_all();
        if (sink_) sink_->emit(RecorderEvent{RecorderEvent::Kind::SilenceDetected, {}});
    }
}
