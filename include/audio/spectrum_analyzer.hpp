#ifndef SPECTRUM_ANALYZER_HPP
#define SPECTRUM_ANALYZER_HPP

#include <complex>
#include <cstdint>
#include <vector>

// Byte-scaled frequency analysis over a sliding window of the most recent
// fftSize samples. Output matches a browser AnalyserNode: Blackman window,
// smoothed magnitudes, dB range mapped onto 0-255.
class SpectrumAnalyzer {
public:
    struct Config {
        int fftSize = 256;           // power of two
        float smoothing = 0.8f;      // time constant, 0 disables smoothing
        float minDecibels = -100.0f;
        float maxDecibels = -30.0f;
    };

    explicit SpectrumAnalyzer(Config config);

    void push(const float* samples, int n);
    void push(const int16_t* samples, int n);

    // Recomputes the spectrum from the current window (one analysis frame)
    const std::vector<uint8_t>& analyze();

    // Mean of the byte bins of the last analyze(), rounded (AudioLevel 0-255)
    int level() const { return level_; }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    int binCount() const { return config_.fftSize / 2; }
    double binHz(int sampleRate) const { return (double)sampleRate / config_.fftSize; }

    void reset();

private:
    Config config_;

    std::vector<float> window_;      // ring of time-domain samples
    int writePos_ = 0;
    std::vector<float> blackman_;
    std::vector<float> smoothed_;
    std::vector<std::complex<float>> scratch_;
    std::vector<uint8_t> bytes_;
    int level_ = 0;
};

// In-place radix-2 Cooley-Tukey FFT, n must be a power of two
void fftRadix2(std::complex<float>* x, int n);

#endif
