#ifndef KEYWORD_GATE_HPP
#define KEYWORD_GATE_HPP

#include "asr/transcriber.hpp"
#include "core/event_loop.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Interrupt-word verification for KeywordGated mode. A finished utterance is
// transcribed on the worker loop and accepted when the transcript contains
// one of the words (case-insensitive substring).
class KeywordGate {
public:
    struct Config {
        std::vector<std::string> words;
        int minSpeechMs = 300;
        int bufferMs = 3000;    // pre-roll kept by each backend
    };

    // Result callback; keyword is empty when nothing matched or ASR failed
    using Callback = std::function<void(const std::string& keyword, const std::string& transcript)>;

    KeywordGate(Config config, std::shared_ptr<Transcriber> transcriber, EventLoop& worker);

    bool enabled() const;
    const Config& config() const { return config_; }
    void setWords(std::vector<std::string> words);

    // First configured word found in text, or empty
    std::string match(const std::string& text) const;

    // Encodes the 16 kHz PCM as WAV and transcribes it on the worker
    void verify(std::vector<int16_t> pcm16k, Callback done);

    // Assistant name and aliases followed by the stop/wait words, de-duplicated
    static std::vector<std::string> buildWordList(const std::string& assistantName,
                                                  const std::vector<std::string>& aliases,
                                                  const std::vector<std::string>& stopWords);

private:
    Config config_;
    std::shared_ptr<Transcriber> transcriber_;
    EventLoop& worker_;
    mutable std::mutex mutex_;
};

#endif
