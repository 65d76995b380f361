#include "config/settings.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>

using json = nlohmann::json;

TEST(SettingsTest, DefaultsMatchTheLocalBackend) {
    const Settings s;
    EXPECT_EQ(s.asr.backend, "http");
    EXPECT_EQ(s.asr.http.url, "http://127.0.0.1:6002/api/asr/transcribe");
    EXPECT_EQ(s.llm.url, "http://127.0.0.1:6002/api/chat");
    EXPECT_EQ(s.tts.http.url, "http://127.0.0.1:6002/api/tts/synthesize");
    EXPECT_EQ(s.vad.type, VadType::Spectral);
    EXPECT_EQ(s.vad.base.ignoreMs, 800);
    EXPECT_EQ(s.recorder.silenceThreshold, 30);
    EXPECT_EQ(s.recorder.silenceDurationMs, 1500);
    EXPECT_EQ(s.call.bargeInGraceMs, 200);
    EXPECT_EQ(s.control.port, 3939);
}

TEST(SettingsTest, MissingKeysKeepDefaults) {
    const Settings s = Settings::fromJson(R"({"vad":{"type":"funasr","ignore_ms":500},"tts":{"gain":4}})");
    EXPECT_EQ(s.vad.type, VadType::SocketServer);
    EXPECT_EQ(s.vad.base.ignoreMs, 500);
    EXPECT_EQ(s.vad.amplitude.threshold, 60);
    EXPECT_FLOAT_EQ(s.tts.player.gain, 4.0f);
    EXPECT_EQ(s.tts.player.voice, "alex");
    EXPECT_EQ(s.llm.maxHistory, 20u);
}

TEST(SettingsTest, InterruptWordsComeFromAssistantSection) {
    const Settings s = Settings::fromJson(
        R"({"assistant":{"name":"Nova","aliases":["Nova"],"stop_words":["stop","Nova"]}})");
    const std::vector<std::string> expected = {"Nova", "Nova", "stop"};
    EXPECT_EQ(s.interruptWords(), expected);
    EXPECT_TRUE(s.call.interruptWords);

    const Settings off = Settings::fromJson(R"({"assistant":{"interrupt_words":false}})");
    EXPECT_FALSE(off.call.interruptWords);
}

TEST(SettingsTest, TtsDisabledReachesTheCall) {
    const Settings s = Settings::fromJson(R"({"tts":{"enabled":false}})");
    EXPECT_FALSE(s.call.ttsEnabled);
}

TEST(SettingsTest, RejectsBadInput) {
    EXPECT_THROW(Settings::fromJson("not json"), std::runtime_error);
    EXPECT_THROW(Settings::fromJson("[]"), std::runtime_error);
    EXPECT_THROW(Settings::fromJson(R"({"vad":{"type":"psychic"}})"), std::runtime_error);
    EXPECT_THROW(Settings::fromJson(R"({"vad":{"ignore_ms":"soon"}})"), std::runtime_error);
    EXPECT_THROW(Settings::fromJson(R"({"asr":{"backend":"carrier-pigeon"}})"), std::runtime_error);
    EXPECT_THROW(Settings::fromJson(R"({"llm":5})"), std::runtime_error);
}

TEST(SettingsTest, SaveThenLoadKeepsValues) {
    Settings s;
    s.asr.backend = "whisper";
    s.vad.type = VadType::Amplitude;
    s.tts.player.speed = 1.5;
    s.control.port = 4000;
    s.assistant.aliases = {"Bo"};

    const std::string path = ::testing::TempDir() + "voice_call_settings_test.json";
    s.save(path);
    const Settings loaded = Settings::load(path);
    std::remove(path.c_str());

    EXPECT_EQ(loaded.asr.backend, "whisper");
    EXPECT_EQ(loaded.vad.type, VadType::Amplitude);
    EXPECT_DOUBLE_EQ(loaded.tts.player.speed, 1.5);
    EXPECT_EQ(loaded.control.port, 4000);
    EXPECT_EQ(loaded.assistant.aliases, std::vector<std::string>{"Bo"});
}

TEST(SettingsTest, MissingFileGivesDefaults) {
    const Settings s = Settings::load(::testing::TempDir() + "does_not_exist_voice_call.json");
    EXPECT_EQ(s.control.port, 3939);
    EXPECT_TRUE(s.call.interruptWords);
}
