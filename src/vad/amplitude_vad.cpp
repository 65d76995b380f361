#include "vad/amplitude_vad.hpp"

#include <iostream>
#include <utility>

namespace {
SpectrumAnalyzer::Config analyzerConfig(int fftSize) {
    SpectrumAnalyzer::Config c;
    c.fftSize = fftSize;
    c.smoothing = 0.8f;
    return c;
}
}  // namespace

// Constructor
AmplitudeVad::AmplitudeVad(Config config, VadBackend::Config base, AudioInputFactory inputFactory,
                           EventSink<VadEvent>* sink, KeywordGate* gate)
    : VadBackend("amplitude", base, std::move(inputFactory), sink, gate),
      config_(config),
      analyzer_(analyzerConfig(config.fftSize)) {}

// Destructor
AmplitudeVad::~AmplitudeVad() { shutdown(); }

void AmplitudeVad::startBackend() {
    std::lock_guard<std::mutex> lock(mutex_);
    analyzer_.reset();
    consecutive_ = 0;
    level_ = 0;
}

void AmplitudeVad::process(const int16_t* pcm16k, size_t n, Clock::time_point now) {
    bool start = false;
    bool end = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        analyzer_.push(pcm16k, (int)n);
        analyzer_.analyze();
        const int level = analyzer_.level();
        level_ = level;

        if (inIgnoreWindow(now)) return;

        if (level > config_.threshold) {
            ++consecutive_;
            if (consecutive_ >= config_.triggerCount && !isSpeaking()) {
                std::cout << "[VAD:amplitude] level " << level << " > " << config_.threshold
                          << " for " << consecutive_ << " frames" << std::endl;
                start = true;
            }
        } else {
            consecutive_ = 0;
            if (isSpeaking()) end = true;
        }
    }

    if (start) reportSpeechStart(now);
    if (end) reportSpeechEnd(now);
}
