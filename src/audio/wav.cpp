#include "audio/wav.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace {

void putU32(AudioBytes& out, size_t at, uint32_t v) {
    out[at] = (uint8_t)(v & 0xff);
    out[at + 1] = (uint8_t)((v >> 8) & 0xff);
    out[at + 2] = (uint8_t)((v >> 16) & 0xff);
    out[at + 3] = (uint8_t)((v >> 24) & 0xff);
}

void putU16(AudioBytes& out, size_t at, uint16_t v) {
    out[at] = (uint8_t)(v & 0xff);
    out[at + 1] = (uint8_t)((v >> 8) & 0xff);
}

uint32_t getU32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

uint16_t getU16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

}  // namespace

AudioBytes encodeWav(const int16_t* samples, size_t count, int sampleRate, int channels) {
    const uint16_t bitsPerSample = 16;
    const uint16_t blockAlign = (uint16_t)(channels * bitsPerSample / 8);
    const uint32_t byteRate = (uint32_t)sampleRate * blockAlign;
    const uint32_t dataSize = (uint32_t)(count * 2);

    AudioBytes out(44 + dataSize);
    std::memcpy(out.data(), "RIFF", 4);
    putU32(out, 4, 36 + dataSize);
    std::memcpy(out.data() + 8, "WAVE", 4);
    std::memcpy(out.data() + 12, "fmt ", 4);
    putU32(out, 16, 16);
    putU16(out, 20, 1);  // PCM
    putU16(out, 22, (uint16_t)channels);
    putU32(out, 24, (uint32_t)sampleRate);
    putU32(out, 28, byteRate);
    putU16(out, 32, blockAlign);
    putU16(out, 34, bitsPerSample);
    std::memcpy(out.data() + 36, "data", 4);
    putU32(out, 40, dataSize);

    for (size_t i = 0; i < count; ++i) putU16(out, 44 + i * 2, (uint16_t)samples[i]);
    return out;
}

AudioBytes encodeWav(const std::vector<int16_t>& samples, int sampleRate, int channels) {
    return encodeWav(samples.data(), samples.size(), sampleRate, channels);
}

PcmAudio decodeWav(const AudioBytes& bytes) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw std::runtime_error("decodeWav: not a RIFF/WAVE buffer");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bits = 0;
    const uint8_t* data = nullptr;
    size_t dataSize = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        const uint32_t size = getU32(chunk + 4);
        const size_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || body + 16 > bytes.size()) throw std::runtime_error("decodeWav: truncated fmt chunk");
            format = getU16(bytes.data() + body);
            channels = getU16(bytes.data() + body + 2);
            sampleRate = getU32(bytes.data() + body + 4);
            bits = getU16(bytes.data() + body + 14);
            if (format == 0xFFFE && size >= 26) {
                // WAVE_FORMAT_EXTENSIBLE, sub-format GUID starts with the real tag
                format = getU16(bytes.data() + body + 24);
            }
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            data = bytes.data() + body;
            // Streaming encoders write 0 or 0xFFFFFFFF when the length is unknown
            dataSize = std::min<size_t>(size, bytes.size() - body);
            if (size == 0 || size == 0xFFFFFFFFu) dataSize = bytes.size() - body;
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!data || channels == 0 || sampleRate == 0) throw std::runtime_error("decodeWav: missing fmt or data chunk");

    PcmAudio pcm;
    pcm.sampleRate = (int)sampleRate;
    pcm.channels = channels;

    if (format == 1 && bits == 16) {
        const size_t n = dataSize / 2;
        pcm.samples.resize(n);
        for (size_t i = 0; i < n; ++i) pcm.samples[i] = (int16_t)getU16(data + i * 2) / 32768.0f;
    } else if (format == 1 && bits == 8) {
        pcm.samples.resize(dataSize);
        for (size_t i = 0; i < dataSize; ++i) pcm.samples[i] = ((int)data[i] - 128) / 128.0f;
    } else if (format == 1 && bits == 24) {
        const size_t n = dataSize / 3;
        pcm.samples.resize(n);
        for (size_t i = 0; i < n; ++i) {
            const uint8_t* p = data + i * 3;
            int32_t v = (int32_t)((uint32_t)p[0] << 8 | (uint32_t)p[1] << 16 | (uint32_t)p[2] << 24) >> 8;
            pcm.samples[i] = v / 8388608.0f;
        }
    } else if (format == 1 && bits == 32) {
        const size_t n = dataSize / 4;
        pcm.samples.resize(n);
        for (size_t i = 0; i < n; ++i) pcm.samples[i] = (float)((int32_t)getU32(data + i * 4) / 2147483648.0);
    } else if (format == 3 && bits == 32) {
        const size_t n = dataSize / 4;
        pcm.samples.resize(n);
        for (size_t i = 0; i < n; ++i) {
            uint32_t raw = getU32(data + i * 4);
            float f;
            std::memcpy(&f, &raw, sizeof(f));
            pcm.samples[i] = f;
        }
    } else {
        throw std::runtime_error("decodeWav: unsupported format " + std::to_string(format) +
                                 " with " + std::to_string(bits) + " bits");
    }

    return pcm;
}

std::vector<int16_t> floatToPcm16(const float* samples, size_t count) {
    std::vector<int16_t> out(count);
    for (size_t i = 0; i < count; ++i) {
        const float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        out[i] = (int16_t)(s < 0 ? s * 0x8000 : s * 0x7FFF);
    }
    return out;
}
