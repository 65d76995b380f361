#ifndef SYNTHESIZER_HPP
#define SYNTHESIZER_HPP

#include "audio/wav.hpp"

#include <string>

struct SynthesisRequest {
    std::string text;
    std::string voice = "alex";
    std::string customVoiceId;   // takes precedence over voice when set
    double speed = 1.0;          // 0.5-2.0
    std::string format = "wav";
};

// Text-to-speech. Blocking and thread-safe; the player calls it from several
// threads at once. Throws std::runtime_error on failure.
class Synthesizer {
public:
    virtual ~Synthesizer() = default;
    virtual AudioBytes synthesize(const SynthesisRequest& request) = 0;
};

#endif
