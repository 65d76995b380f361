#ifndef HTTP_SYNTHESIZER_HPP
#define HTTP_SYNTHESIZER_HPP

#include "net/http_client.hpp"
#include "tts/synthesizer.hpp"

#include <string>

// POST {text, voice, custom_voice_id?, speed, response_format} -> audio bytes
class HttpSynthesizer : public Synthesizer {
public:
    struct Config {
        std::string url = "http://127.0.0.1:6002/api/tts/synthesize";
        std::string healthUrl = "http://127.0.0.1:6002/api/tts/health";
        long timeoutMs = 30000;
    };

    explicit HttpSynthesizer(Config config);

    AudioBytes synthesize(const SynthesisRequest& request) override;

    bool healthy() const;

    static std::string requestBody(const SynthesisRequest& request);
    static double clampSpeed(double speed);

private:
    Config config_;
    HttpClient http_;
};

#endif
