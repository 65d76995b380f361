#include "audio/resampler.hpp"

#include <speex/speex_resampler.h>

#include <stdexcept>
#include <string>

// Constructor
Resampler::Resampler(int inRate, int outRate, int quality) : inRate_(inRate), outRate_(outRate) {
    if (inRate_ == outRate_) return;

    int err = RESAMPLER_ERR_SUCCESS;
    state_ = speex_resampler_init(1, (spx_uint32_t)inRate_, (spx_uint32_t)outRate_, quality, &err);
    if (err != RESAMPLER_ERR_SUCCESS || !state_) {
        throw std::runtime_error(std::string("speex_resampler_init failed: ") + speex_resampler_strerror(err));
    }
}

// Destructor
Resampler::~Resampler() {
    if (state_) speex_resampler_destroy(state_);
}

std::vector<int16_t> Resampler::process(const int16_t* samples, size_t n) {
    if (!state_) return std::vector<int16_t>(samples, samples + n);

    std::vector<int16_t> out((size_t)((double)n * outRate_ / inRate_) + 16);
    spx_uint32_t inLen = (spx_uint32_t)n;
    spx_uint32_t outLen = (spx_uint32_t)out.size();

    const int err = speex_resampler_process_int(state_, 0, samples, &inLen, out.data(), &outLen);
    if (err != RESAMPLER_ERR_SUCCESS) {
        throw std::runtime_error(std::string("speex_resampler_process_int failed: ") + speex_resampler_strerror(err));
    }

    out.resize(outLen);
    return out;
}
