#ifndef HTTP_TRANSCRIBER_HPP
#define HTTP_TRANSCRIBER_HPP

#include "asr/transcriber.hpp"
#include "net/http_client.hpp"

#include <string>

// Remote transcription service: multipart POST, field "audio",
// reply {success, text, segments}
class HttpTranscriber : public Transcriber {
public:
    struct Config {
        std::string url = "http://127.0.0.1:6002/api/asr/transcribe";
        std::string healthUrl = "http://127.0.0.1:6002/api/asr/health";
        long timeoutMs = 30000;
    };

    explicit HttpTranscriber(Config config);

    TranscriptResult transcribe(const AudioBytes& audio) override;

    bool healthy() const;

    // Throws std::runtime_error when the body is not a JSON object
    static TranscriptResult parseResult(const std::string& body);

private:
    Config config_;
    HttpClient http_;
};

#endif
