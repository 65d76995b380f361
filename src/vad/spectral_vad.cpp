#include "vad/spectral_vad.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace {
SpectrumAnalyzer::Config analyzerConfig(const SpectralVad::Config& config) {
    SpectrumAnalyzer::Config c;
    c.fftSize = config.fftSize;
    c.smoothing = config.smoothing;
    return c;
}
}  // namespace

// Constructor
SpectralVad::SpectralVad(Config config, VadBackend::Config base, AudioInputFactory inputFactory,
                         EventSink<VadEvent>* sink, KeywordGate* gate)
    : VadBackend("spectral", base, std::move(inputFactory), sink, gate),
      config_(config),
      analyzer_(analyzerConfig(config)) {}

// Destructor
SpectralVad::~SpectralVad() { shutdown(); }

SpectralVad::Frame SpectralVad::classify(const std::vector<uint8_t>& bins, double binHz, const Config& config) {
    Frame frame;
    if (bins.empty() || binHz <= 0.0) return frame;

    const int last = (int)bins.size() - 1;
    const int lo = std::min(last, (int)std::floor(config.bandLowHz / binHz));
    const int hi = std::min(last, (int)std::floor(config.bandHighHz / binHz));

    double total = 0.0;
    double band = 0.0;
    for (int i = 0; i <= last; ++i) {
        const double energy = bins[i] / 255.0;
        total += energy;
        if (i >= lo && i <= hi) band += energy;
    }
    if (total <= 0.0) return frame;

    frame.ratio = band / total;
    frame.bandEnergy = band / (hi - lo + 1);
    frame.speech = frame.ratio > config.speechFreqRatio && frame.bandEnergy > config.threshold;
    return frame;
}

void SpectralVad::startBackend() {
    std::lock_guard<std::mutex> lock(mutex_);
    analyzer_.reset();
    speechCount_ = 0;
    silenceCount_ = 0;
}

void SpectralVad::process(const int16_t* pcm16k, size_t n, Clock::time_point now) {
    bool start = false;
    bool end = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        analyzer_.push(pcm16k, (int)n);
        const std::vector<uint8_t>& bins = analyzer_.analyze();

        if (inIgnoreWindow(now)) return;

        const Frame frame = classify(bins, analyzer_.binHz(16000), config_);
        if (frame.speech) {
            ++speechCount_;
            silenceCount_ = 0;
            if (!isSpeaking() && speechCount_ >= config_.speechFrames) {
                std::cout << "[VAD:spectral] ratio " << frame.ratio << ", band energy " << frame.bandEnergy << std::endl;
                start = true;
            }
        } else {
            ++silenceCount_;
            speechCount_ = 0;
            if (isSpeaking() && silenceCount_ >= config_.silenceFrames) end = true;
        }
    }

    if (start) reportSpeechStart(now);
    if (end) reportSpeechEnd(now);
}
