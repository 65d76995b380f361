#ifndef PCM_RING_BUFFER_HPP
#define PCM_RING_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

// Keeps the most recent maxMs of 16-bit PCM. Written from the capture thread,
// snapshotted from elsewhere.
class PcmRingBuffer {
public:
    PcmRingBuffer(int sampleRate, int maxMs);

    void push(const int16_t* samples, size_t n);
    std::vector<int16_t> snapshot() const;
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    int sampleRate() const { return sampleRate_; }

private:
    int sampleRate_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::vector<int16_t> data_;
    size_t head_ = 0;   // next write position
    size_t count_ = 0;
};

#endif
