#include "chat/sentence_segmenter.hpp"

namespace {
const char* const kStrong[] = {"\xE3\x80\x82", "\xEF\xBC\x81", "\xEF\xBC\x9F", ".", "!", "?", "\n"};  // 。！？
const char* const kWeak[] = {"\xEF\xBC\x8C", ",", "\xEF\xBC\x9B", ";", "\xEF\xBC\x9A", ":"};          // ，；：

template <size_t N>
bool containsAny(const std::string& s, const char* const (&needles)[N]) {
    for (const char* n : needles) {
        if (s.find(n) != std::string::npos) return true;
    }
    return false;
}

bool isSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}
}  // namespace

// Constructor
SentenceSegmenter::SentenceSegmenter() : SentenceSegmenter(Config{}) {}

SentenceSegmenter::SentenceSegmenter(Config config) : config_(config) {}

size_t SentenceSegmenter::codePoints(const std::string& utf8) {
    size_t n = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string SentenceSegmenter::trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace((unsigned char)s[b])) ++b;
    while (e > b && isSpace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

bool SentenceSegmenter::hasStrongTerminator(const std::string& chunk) {
    return containsAny(chunk, kStrong);
}

bool SentenceSegmenter::hasWeakTerminator(const std::string& chunk) {
    return containsAny(chunk, kWeak);
}

std::string SentenceSegmenter::push(const std::string& chunk) {
    buffer_ += chunk;

    const std::string sentence = trim(buffer_);
    const size_t length = codePoints(sentence);
    if (length == 0) return {};

    const bool flush = hasStrongTerminator(chunk) ||
                       (hasWeakTerminator(chunk) && length >= config_.minLengthForWeak) ||
                       length >= config_.maxBufferLength;
    if (!flush) return {};

    buffer_.clear();
    return sentence;
}

std::string SentenceSegmenter::finish() {
    std::string rest = trim(buffer_);
    buffer_.clear();
    return rest;
}
