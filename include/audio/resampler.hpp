#ifndef RESAMPLER_HPP
#define RESAMPLER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

struct SpeexResamplerState_;

// Mono int16 sample-rate converter (speexdsp). Pass-through when rates match.
class Resampler {
public:
    Resampler(int inRate, int outRate, int quality = 5);
    ~Resampler();

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    std::vector<int16_t> process(const int16_t* samples, size_t n);

    int inRate() const { return inRate_; }
    int outRate() const { return outRate_; }

private:
    int inRate_;
    int outRate_;
    SpeexResamplerState_* state_ = nullptr;
};

#endif
