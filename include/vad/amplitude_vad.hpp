#ifndef AMPLITUDE_VAD_HPP
#define AMPLITUDE_VAD_HPP

#include "audio/spectrum_analyzer.hpp"
#include "vad/vad_backend.hpp"

#include <atomic>
#include <mutex>

// AudioLevel against a fixed threshold. triggerCount consecutive loud frames
// confirm speech; the first quiet frame resets the count and ends it.
class AmplitudeVad : public VadBackend {
public:
    struct Config {
        int threshold = 60;      // AudioLevel 0-255
        int triggerCount = 5;
        int fftSize = 256;
    };

    AmplitudeVad(Config config, VadBackend::Config base, AudioInputFactory inputFactory,
                 EventSink<VadEvent>* sink, KeywordGate* gate);
    ~AmplitudeVad() override;

    int level() const { return level_.load(); }

protected:
    void startBackend() override;
    void process(const int16_t* pcm16k, size_t n, Clock::time_point now) override;

private:
    Config config_;

    std::mutex mutex_;
    SpectrumAnalyzer analyzer_;
    int consecutive_ = 0;
    std::atomic<int> level_{0};
};

#endif
