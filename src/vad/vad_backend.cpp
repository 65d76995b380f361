#include "vad/vad_backend.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace {
int64_t toMs(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}
}  // namespace

// Constructor
VadBackend::VadBackend(std::string name, Config config, AudioInputFactory inputFactory,
                       EventSink<VadEvent>* sink, KeywordGate* gate)
    : name_(std::move(name)),
      config_(config),
      inputFactory_(std::move(inputFactory)),
      sink_(sink),
      gate_(gate),
      preRoll_(16000, gate ? gate->config().bufferMs : 3000),
      gateState_(std::make_shared<GateState>()) {}

// Destructor
VadBackend::~VadBackend() {
    nextGeneration();
    if (input_) input_->stop();
}

void VadBackend::nextGeneration() {
    std::lock_guard<std::mutex> lock(gateState_->mutex);
    ++gateState_->generation;
}

void VadBackend::shutdown() {
    if (active_.load()) stop();
}

void VadBackend::start(VadMode mode) {
    if (active_.load()) stop();

    nextGeneration();

    mode_ = mode;
    gated_ = mode == VadMode::KeywordGated && gate_ && gate_->enabled();
    speaking_ = false;
    preRoll_.clear();

    try {
        startBackend();
    } catch (...) {
        setStatus(VadStatus::Stopped);
        throw;
    }

    std::unique_ptr<AudioInput> input = inputFactory_ ? inputFactory_() : nullptr;
    if (!input) {
        stopBackend();
        setStatus(VadStatus::Stopped);
        throw std::runtime_error("VAD " + name_ + ": no input device");
    }
    resampler_.reset();
    if (input->sampleRate() != 16000) resampler_ = std::make_unique<Resampler>(input->sampleRate(), 16000);

    active_ = true;
    try {
        input->start([this](const int16_t* samples, int frames) {
            onFrames(samples, frames, Clock::now());
        }, [this](const std::string& error) {
            std::cerr << "[VAD:" << name_ << "] [ERROR] Input lost: " << error << std::endl;
            setStatus(VadStatus::Stopped);
        });
    } catch (...) {
        active_ = false;
        resampler_.reset();
        stopBackend();
        setStatus(VadStatus::Stopped);
        throw;
    }
    input_ = std::move(input);

    if (activeOnStart()) {
        armIgnoreWindow(Clock::now());
        setStatus(VadStatus::Active);
    }

    std::cout << "[VAD:" << name_ << "] Started ("
              << (gated_.load() ? "keyword-gated" : "direct") << "), ignoring "
              << config_.ignoreMs << "ms" << std::endl;
}

void VadBackend::stop() {
    if (!active_.exchange(false)) return;

    nextGeneration();

    if (input_) {
        input_->stop();
        input_.reset();
    }
    resampler_.reset();
    stopBackend();

    speaking_ = false;
    preRoll_.clear();
    setStatus(VadStatus::Stopped);
    std::cout << "[VAD:" << name_ << "] Stopped" << std::endl;
}

void VadBackend::onFrames(const int16_t* samples, int frames, Clock::time_point now) {
    if (!active_.load() || frames <= 0) return;

    std::vector<int16_t> converted;
    const int16_t* pcm = samples;
    size_t n = (size_t)frames;
    if (resampler_) {
        converted = resampler_->process(samples, n);
        pcm = converted.data();
        n = converted.size();
        if (n == 0) return;
    }

    // Always filled so words spoken just before the detector fires are kept
    if (gated_.load()) preRoll_.push(pcm, n);

    process(pcm, n, now);
}

void VadBackend::armIgnoreWindow(Clock::time_point now) {
    ignoreUntilMs_ = toMs(now) + config_.ignoreMs;
}

bool VadBackend::inIgnoreWindow(Clock::time_point now) const {
    return toMs(now) < ignoreUntilMs_.load();
}

void VadBackend::reportSpeechStart(Clock::time_point now) {
    if (!active_.load()) return;
    if (inIgnoreWindow(now)) {
        std::cout << "[VAD:" << name_ << "] Inside ignore window, speech start skipped" << std::endl;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(speechMutex_);
        if (speaking_.load()) return;
        speaking_ = true;
        speechStartedAt_ = now;
    }

    if (gated_.load()) {
        std::cout << "[VAD:" << name_ << "] Speech start, awaiting interrupt word" << std::endl;
        return;
    }

    std::cout << "[VAD:" << name_ << "] Speech start" << std::endl;
    emit(VadEvent{VadEvent::Kind::SpeechStart, status(), {}});
}

void VadBackend::reportSpeechEnd(Clock::time_point now) {
    if (!active_.load()) return;

    long durationMs;
    {
        std::lock_guard<std::mutex> lock(speechMutex_);
        if (!speaking_.load()) return;
        speaking_ = false;
        durationMs = (long)std::chrono::duration_cast<std::chrono::milliseconds>(now - speechStartedAt_).count();
    }

    if (!gated_.load()) {
        std::cout << "[VAD:" << name_ << "] Speech end" << std::endl;
        emit(VadEvent{VadEvent::Kind::SpeechEnd, status(), {}});
        return;
    }

    if (durationMs < gate_->config().minSpeechMs || preRoll_.size() == 0) {
        std::cout << "[VAD:" << name_ << "] Utterance too short (" << durationMs << "ms), not verified" << std::endl;
        preRoll_.clear();
        emit(VadEvent{VadEvent::Kind::SpeechEnd, status(), {}});
        return;
    }

    std::shared_ptr<GateState> state = gateState_;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        generation = state->generation;
    }

    std::vector<int16_t> audio = preRoll_.snapshot();
    preRoll_.clear();
    setStatus(VadStatus::Verifying);

    // Holding state->mutex keeps the destructor from finishing under us
    gate_->verify(std::move(audio), [this, state, generation](const std::string& keyword, const std::string&) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (generation != state->generation) {
            std::cout << "[VAD] Verification result discarded" << std::endl;
            return;
        }
        setStatus(VadStatus::Active);
        if (!keyword.empty()) emit(VadEvent{VadEvent::Kind::SpeechStart, VadStatus::Active, keyword});
        emit(VadEvent{VadEvent::Kind::SpeechEnd, VadStatus::Active, {}});
    });
}

void VadBackend::setStatus(VadStatus status) {
    if (status_.exchange(status) == status) return;
    emit(VadEvent{VadEvent::Kind::StatusChanged, status, {}});
}

void VadBackend::emit(const VadEvent& event) {
    if (sink_) sink_->emit(event);
}
