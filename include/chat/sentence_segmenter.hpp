#ifndef SENTENCE_SEGMENTER_HPP
#define SENTENCE_SEGMENTER_HPP

#include <cstddef>
#include <string>
#include <vector>

// Groups streamed tokens into speakable sentences. A chunk containing a strong
// terminator flushes; a weak terminator flushes once the buffer is long
// enough; an over-long buffer flushes regardless. Lengths are code points of
// the trimmed buffer.
class SentenceSegmenter {
public:
    struct Config {
        size_t minLengthForWeak = 15;
        size_t maxBufferLength = 50;
    };

    SentenceSegmenter();
    explicit SentenceSegmenter(Config config);

    // Returns the flushed sentence, or empty when the chunk was only buffered
    std::string push(const std::string& chunk);

    // Returns the trimmed remainder and clears the buffer
    std::string finish();

    void reset() { buffer_.clear(); }
    const std::string& buffer() const { return buffer_; }

    static size_t codePoints(const std::string& utf8);
    static std::string trim(const std::string& s);
    static bool hasStrongTerminator(const std::string& chunk);
    static bool hasWeakTerminator(const std::string& chunk);

private:
    Config config_;
    std::string buffer_;
};

#endif
