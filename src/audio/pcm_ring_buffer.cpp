#include "audio/pcm_ring_buffer.hpp"

#include <algorithm>

// Constructor
PcmRingBuffer::PcmRingBuffer(int sampleRate, int maxMs)
    : sampleRate_(sampleRate), capacity_((size_t)std::max(1, (maxMs * sampleRate) / 1000)) {
    data_.assign(capacity_, 0);
}

void PcmRingBuffer::push(const int16_t* samples, size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Only the tail of an oversized write can survive
    if (n > capacity_) {
        samples += n - capacity_;
        n = capacity_;
    }

    for (size_t i = 0; i < n; ++i) {
        data_[head_] = samples[i];
        head_ = (head_ + 1) % capacity_;
    }
    count_ = std::min(capacity_, count_ + n);
}

std::vector<int16_t> PcmRingBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int16_t> out(count_);
    const size_t start = (head_ + capacity_ - count_) % capacity_;
    for (size_t i = 0; i < count_; ++i) out[i] = data_[(start + i) % capacity_];
    return out;
}

void PcmRingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    head_ = 0;
    count_ = 0;
}

size_t PcmRingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}
