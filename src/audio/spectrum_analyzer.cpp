#include "audio/spectrum_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {
constexpr double kPi = 3.14159265358979323846;
}

void fftRadix2(std::complex<float>* x, int n) {
    // bit-reversal permutation
    for (int i = 1, j = 0; i < n; i++) {
        int bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(x[i], x[j]);
    }
    // butterflies
    for (int len = 2; len <= n; len <<= 1) {
        const float ang = -2.0f * (float)kPi / len;
        const std::complex<float> wlen(std::cos(ang), std::sin(ang));
        for (int i = 0; i < n; i += len) {
            std::complex<float> w(1.0f, 0.0f);
            for (int j = 0; j < len / 2; j++) {
                auto u = x[i + j];
                auto v = x[i + j + len / 2] * w;
                x[i + j] = u + v;
                x[i + j + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}

// Constructor
SpectrumAnalyzer::SpectrumAnalyzer(Config config) : config_(config) {
    const int n = config_.fftSize;
    if (n < 32 || (n & (n - 1)) != 0) {
        throw std::invalid_argument("SpectrumAnalyzer: fftSize must be a power of two >= 32, got " + std::to_string(n));
    }

    window_.assign(n, 0.0f);
    scratch_.resize(n);
    smoothed_.assign(n / 2, 0.0f);
    bytes_.assign(n / 2, 0);

    // Blackman window, alpha = 0.16
    blackman_.resize(n);
    const double a0 = 0.42, a1 = 0.5, a2 = 0.08;
    for (int i = 0; i < n; ++i) {
        const double x = (double)i / n;
        blackman_[i] = (float)(a0 - a1 * std::cos(2.0 * kPi * x) + a2 * std::cos(4.0 * kPi * x));
    }
}

void SpectrumAnalyzer::reset() {
    std::fill(window_.begin(), window_.end(), 0.0f);
    std::fill(smoothed_.begin(), smoothed_.end(), 0.0f);
    std::fill(bytes_.begin(), bytes_.end(), 0);
    writePos_ = 0;
    level_ = 0;
}

void SpectrumAnalyzer::push(const float* samples, int n) {
    const int size = config_.fftSize;
    for (int i = 0; i < n; ++i) {
        window_[writePos_] = samples[i];
        writePos_ = (writePos_ + 1) % size;
    }
}

void SpectrumAnalyzer::push(const int16_t* samples, int n) {
    const int size = config_.fftSize;
    for (int i = 0; i < n; ++i) {
        window_[writePos_] = (float)samples[i] / 32768.0f;
        writePos_ = (writePos_ + 1) % size;
    }
}

const std::vector<uint8_t>& SpectrumAnalyzer::analyze() {
    const int n = config_.fftSize;

    // Oldest sample first
    for (int i = 0; i < n; ++i) {
        const float s = window_[(writePos_ + i) % n];
        scratch_[i] = std::complex<float>(s * blackman_[i], 0.0f);
    }
    fftRadix2(scratch_.data(), n);

    const float tau = std::max(0.0f, std::min(1.0f, config_.smoothing));
    const float range = config_.maxDecibels - config_.minDecibels;

    long sum = 0;
    for (int k = 0; k < n / 2; ++k) {
        const float mag = std::abs(scratch_[k]) / n;
        smoothed_[k] = tau * smoothed_[k] + (1.0f - tau) * mag;

        float db = smoothed_[k] > 0.0f ? 20.0f * std::log10(smoothed_[k]) : config_.minDecibels;
        float scaled = 255.0f * (db - config_.minDecibels) / range;
        scaled = std::max(0.0f, std::min(255.0f, scaled));

        bytes_[k] = (uint8_t)scaled;
        sum += bytes_[k];
    }

    level_ = (int)std::lround((double)sum / (n / 2));
    return bytes_;
}
