#ifndef WAV_HPP
#define WAV_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

using AudioBytes = std::vector<uint8_t>;

struct PcmAudio {
    int sampleRate = 16000;
    int channels = 1;
    std::vector<float> samples;  // interleaved, -1..1

    double durationSeconds() const {
        if (sampleRate <= 0 || channels <= 0) return 0.0;
        return (double)samples.size() / channels / sampleRate;
    }
};

// 44-byte canonical header followed by little-endian PCM16
AudioBytes encodeWav(const int16_t* samples, size_t count, int sampleRate = 16000, int channels = 1);
AudioBytes encodeWav(const std::vector<int16_t>& samples, int sampleRate = 16000, int channels = 1);

// Parses a RIFF/WAVE buffer (PCM 8/16/24/32-bit or IEEE float 32-bit).
// Throws std::runtime_error on malformed input.
PcmAudio decodeWav(const AudioBytes& bytes);

std::vector<int16_t> floatToPcm16(const float* samples, size_t count);

#endif
