#include "vad/keyword_gate.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace {
// ASCII-only folding; multi-byte UTF-8 sequences pass through unchanged
std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? (char)std::tolower(c) : (char)c;
    });
    return out;
}
}  // namespace

// Constructor
KeywordGate::KeywordGate(Config config, std::shared_ptr<Transcriber> transcriber, EventLoop& worker)
    : config_(std::move(config)), transcriber_(std::move(transcriber)), worker_(worker) {}

bool KeywordGate::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcriber_ && !config_.words.empty();
}

void KeywordGate::setWords(std::vector<std::string> words) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.words = std::move(words);
}

std::string KeywordGate::match(const std::string& text) const {
    if (text.empty()) return {};
    const std::string haystack = lower(text);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& word : config_.words) {
        if (word.empty()) continue;
        if (haystack.find(lower(word)) != std::string::npos) return word;
    }
    return {};
}

void KeywordGate::verify(std::vector<int16_t> pcm16k, Callback done) {
    std::shared_ptr<Transcriber> transcriber = transcriber_;
    auto samples = std::make_shared<std::vector<int16_t>>(std::move(pcm16k));

    worker_.post([this, transcriber, samples, done] {
        std::string keyword;
        std::string text;
        try {
            const AudioBytes wav = encodeWav(*samples, 16000, 1);
            std::cout << "[KeywordGate] Verifying " << wav.size() << " bytes of audio" << std::endl;

            TranscriptResult result = transcriber->transcribe(wav);
            text = result.text;
            std::cout << "[KeywordGate] Transcript: \"" << text << "\"" << std::endl;
            if (result.success) keyword = match(text);
        } catch (const std::exception& e) {
            std::cerr << "[KeywordGate] [ERROR] verification failed: " << e.what() << std::endl;
        }

        if (keyword.empty()) std::cout << "[KeywordGate] No interrupt word" << std::endl;
        else std::cout << "[KeywordGate] Matched \"" << keyword << "\"" << std::endl;
        done(keyword, text);
    });
}

std::vector<std::string> KeywordGate::buildWordList(const std::string& assistantName,
                                                    const std::vector<std::string>& aliases,
                                                    const std::vector<std::string>& stopWords) {
    std::vector<std::string> words;
    auto add = [&words](const std::string& w) {
        if (w.empty()) return;
        if (std::find(words.begin(), words.end(), w) == words.end()) words.push_back(w);
    };

    add(assistantName);
    for (const auto& a : aliases) add(a);
    for (const auto& s : stopWords) add(s);
    return words;
}
