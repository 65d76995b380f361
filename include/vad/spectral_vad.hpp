#ifndef SPECTRAL_VAD_HPP
#define SPECTRAL_VAD_HPP

#include "audio/spectrum_analyzer.hpp"
#include "vad/vad_backend.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

// Speech-band energy ratio on a 2048-point spectrum. A frame is speech when
// the 85-3000 Hz band holds more than speechFreqRatio of the energy and its
// mean normalized energy exceeds threshold.
class SpectralVad : public VadBackend {
public:
    struct Config {
        float threshold = 0.3f;
        float speechFreqRatio = 0.4f;
        int speechFrames = 3;
        int silenceFrames = 15;
        int fftSize = 2048;
        float smoothing = 0.5f;
        double bandLowHz = 85.0;
        double bandHighHz = 3000.0;
    };

    struct Frame {
        bool speech = false;
        double ratio = 0.0;
        double bandEnergy = 0.0;  // mean over the band, 0-1
    };

    SpectralVad(Config config, VadBackend::Config base, AudioInputFactory inputFactory,
                EventSink<VadEvent>* sink, KeywordGate* gate);
    ~SpectralVad() override;

    static Frame classify(const std::vector<uint8_t>& bins, double binHz, const Config& config);

protected:
    void startBackend() override;
    void process(const int16_t* pcm16k, size_t n, Clock::time_point now) override;

private:
    Config config_;

    std::mutex mutex_;
    SpectrumAnalyzer analyzer_;
    int speechCount_ = 0;
    int silenceCount_ = 0;
};

#endif
