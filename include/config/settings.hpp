#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "asr/http_transcriber.hpp"
#include "asr/whisper_transcriber.hpp"
#include "audio/audio_device.hpp"
#include "audio/audio_recorder.hpp"
#include "call/call_state_machine.hpp"
#include "chat/sse_chat_client.hpp"
#include "tts/http_synthesizer.hpp"
#include "tts/streaming_tts_player.hpp"
#include "vad/vad_factory.hpp"

#include <string>
#include <vector>

// Everything a session needs, read from config.json. Missing keys keep their
// defaults.
struct Settings {
    struct Asr {
        std::string backend = "http";    // "http" or "whisper"
        HttpTranscriber::Config http;
        WhisperTranscriber::Config whisper;
    };

    struct Tts {
        bool enabled = true;
        HttpSynthesizer::Config http;
        StreamingTtsPlayer::Config player;
    };

    struct Audio {
        AudioInput::Config input;
        AudioOutput::Config output;
    };

    struct Assistant {
        std::string name = "\xE5\xB0\x8F\xE6\x99\xBA";          // 小智
        std::vector<std::string> aliases = {"\xE5\xB0\x8F\xE7\x9F\xA5", "\xE5\xB0\x8F\xE5\xBF\x97"};  // 小知 小志
        std::vector<std::string> stopWords = {
            "\xE5\x81\x9C",                                      // 停
            "\xE7\xAD\x89\xE4\xB8\x80\xE4\xB8\x8B",              // 等一下
            "\xE7\xAD\x89\xE7\xAD\x89",                          // 等等
            "\xE5\x88\xAB\xE8\xAF\xB4\xE4\xBA\x86",              // 别说了
            "stop",
            "wait"
        };
        bool interruptWords = true;   // keyword-gated barge-in
    };

    struct Control {
        std::string bindIp = "127.0.0.1";
        int port = 3939;
    };

    Asr asr;
    SseChatClient::Config llm;
    Tts tts;
    VadSettings vad;
    AudioRecorder::Config recorder;
    Audio audio;
    CallStateMachine::Config call;
    Assistant assistant;
    Control control;

    // Throws std::runtime_error when the file exists but cannot be parsed
    static Settings load(const std::string& path);
    static Settings fromJson(const std::string& text);

    std::string toJson() const;
    void save(const std::string& path) const;

    std::vector<std::string> interruptWords() const;
};

#endif
