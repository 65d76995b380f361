#ifndef WHISPER_TRANSCRIBER_HPP
#define WHISPER_TRANSCRIBER_HPP

#include "asr/transcriber.hpp"

#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

// Local whisper.cpp model. Accepts WAV at any rate; audio is downmixed and
// resampled to 16 kHz mono before inference.
class WhisperTranscriber : public Transcriber {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base-q5_1.bin";
        std::string language = "zh";
        int threads = 4;
        float noSpeechThreshold = 0.6f;
    };

    explicit WhisperTranscriber(Config config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    TranscriptResult transcribe(const AudioBytes& audio) override;

    TranscriptResult transcribePcm(const std::vector<float>& pcm16kMono);

private:
    Config config_;
    whisper_context* context_ = nullptr;
    std::mutex mutex_;
};

#endif
