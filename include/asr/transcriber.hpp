#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include "audio/wav.hpp"

#include <string>
#include <vector>

struct TranscriptSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

struct TranscriptResult {
    bool success = false;
    std::string text;
    std::vector<TranscriptSegment> segments;
};

// Speech-to-text over a complete recording (any container the backend reads).
// Blocking; runs on a worker. Throws std::runtime_error on transport failure.
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual TranscriptResult transcribe(const AudioBytes& audio) = 0;
};

#endif
