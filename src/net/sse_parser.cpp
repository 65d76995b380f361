#include "net/sse_parser.hpp"

bool SseParser::payload(const std::string& line, std::string& out) {
    std::string l = line;
    if (!l.empty() && l.back() == '\r') l.pop_back();
    if (l.compare(0, 6, "data: ") != 0) return false;
    out = l.substr(6);
    return true;
}

std::vector<std::string> SseParser::feed(const char* data, size_t size) {
    std::vector<std::string> out;
    buffer_.append(data, size);

    size_t start = 0;
    size_t nl;
    while ((nl = buffer_.find('\n', start)) != std::string::npos) {
        std::string p;
        if (payload(buffer_.substr(start, nl - start), p)) out.push_back(std::move(p));
        start = nl + 1;
    }
    buffer_.erase(0, start);
    return out;
}

std::vector<std::string> SseParser::finish() {
    std::vector<std::string> out;
    std::string p;
    if (!buffer_.empty() && payload(buffer_, p)) out.push_back(std::move(p));
    buffer_.clear();
    return out;
}
