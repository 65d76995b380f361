#ifndef SSE_PARSER_HPP
#define SSE_PARSER_HPP

#include <cstddef>
#include <string>
#include <vector>

// Splits a byte stream into lines and returns the payload of every
// "data: " line. Partial lines are held until the next feed().
class SseParser {
public:
    std::vector<std::string> feed(const char* data, size_t size);
    std::vector<std::string> feed(const std::string& chunk) { return feed(chunk.data(), chunk.size()); }

    // Returns the trailing line when it is a complete data line
    std::vector<std::string> finish();

    void reset() { buffer_.clear(); }

private:
    static bool payload(const std::string& line, std::string& out);

    std::string buffer_;
};

#endif
