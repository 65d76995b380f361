#include "config/settings.hpp"

#include "vad/keyword_gate.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Overwrites out only when the key is present
template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("config: bad value for '") + key + "': " + e.what());
    }
}

const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end()) return empty;
    if (!it->is_object()) throw std::runtime_error(std::string("config: '") + key + "' must be an object");
    return *it;
}

}  // namespace

Settings Settings::fromJson(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw std::runtime_error("config: not a JSON object");
    }

    Settings s;

    const json& asr = section(root, "asr");
    read(asr, "backend", s.asr.backend);
    read(asr, "url", s.asr.http.url);
    read(asr, "health_url", s.asr.http.healthUrl);
    read(asr, "timeout_ms", s.asr.http.timeoutMs);
    read(asr, "whisper_model", s.asr.whisper.modelPath);
    read(asr, "language", s.asr.whisper.language);
    read(asr, "threads", s.asr.whisper.threads);
    read(asr, "no_speech_threshold", s.asr.whisper.noSpeechThreshold);
    if (s.asr.backend != "http" && s.asr.backend != "whisper") {
        throw std::runtime_error("config: asr.backend must be \"http\" or \"whisper\"");
    }

    const json& llm = section(root, "llm");
    read(llm, "url", s.llm.url);
    read(llm, "model", s.llm.model);
    read(llm, "temperature", s.llm.temperature);
    read(llm, "max_tokens", s.llm.maxTokens);
    read(llm, "max_history", s.llm.maxHistory);

    const json& tts = section(root, "tts");
    read(tts, "enabled", s.tts.enabled);
    read(tts, "url", s.tts.http.url);
    read(tts, "health_url", s.tts.http.healthUrl);
    read(tts, "timeout_ms", s.tts.http.timeoutMs);
    read(tts, "voice", s.tts.player.voice);
    read(tts, "custom_voice_id", s.tts.player.customVoiceId);
    read(tts, "speed", s.tts.player.speed);
    read(tts, "gain", s.tts.player.gain);

    const json& vad = section(root, "vad");
    read(vad, "enabled", s.vad.enabled);
    std::string type;
    read(vad, "type", type);
    if (!type.empty()) {
        try {
            s.vad.type = parseVadType(type);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("config: ") + e.what());
        }
    }
    read(vad, "ignore_ms", s.vad.base.ignoreMs);
    read(vad, "threshold", s.vad.amplitude.threshold);
    read(vad, "trigger_count", s.vad.amplitude.triggerCount);
    read(vad, "spectral_threshold", s.vad.spectral.threshold);
    read(vad, "speech_freq_ratio", s.vad.spectral.speechFreqRatio);
    read(vad, "speech_frames", s.vad.spectral.speechFrames);
    read(vad, "silence_frames", s.vad.spectral.silenceFrames);
    read(vad, "backend_url", s.vad.backendUrl);
    read(vad, "server_url", s.vad.serverUrl);

    const json& rec = section(root, "recorder");
    read(rec, "silence_threshold", s.recorder.silenceThreshold);
    read(rec, "silence_duration_ms", s.recorder.silenceDurationMs);
    read(rec, "max_recording_ms", s.recorder.maxRecordingMs);

    const json& audio = section(root, "audio");
    read(audio, "input_device", s.audio.input.device);
    read(audio, "output_device", s.audio.output.device);
    read(audio, "sample_rate", s.audio.input.sampleRate);
    read(audio, "frames_per_buffer", s.audio.input.framesPerBuffer);

    const json& call = section(root, "call");
    read(call, "barge_in_grace_ms", s.call.bargeInGraceMs);

    const json& assistant = section(root, "assistant");
    read(assistant, "name", s.assistant.name);
    read(assistant, "aliases", s.assistant.aliases);
    read(assistant, "stop_words", s.assistant.stopWords);
    read(assistant, "interrupt_words", s.assistant.interruptWords);

    const json& control = section(root, "control");
    read(control, "bind_ip", s.control.bindIp);
    read(control, "port", s.control.port);

    s.call.ttsEnabled = s.tts.enabled;
    s.call.interruptWords = s.assistant.interruptWords && !s.interruptWords().empty();
    return s;
}

Settings Settings::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cout << "[Config] " << path << " not found, using defaults" << std::endl;
        Settings s;
        s.call.interruptWords = s.assistant.interruptWords && !s.interruptWords().empty();
        return s;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    Settings s = fromJson(ss.str());
    std::cout << "[Config] Loaded " << path << std::endl;
    return s;
}

std::string Settings::toJson() const {
    json j = {
        {"asr", {
            {"backend", asr.backend},
            {"url", asr.http.url},
            {"health_url", asr.http.healthUrl},
            {"timeout_ms", asr.http.timeoutMs},
            {"whisper_model", asr.whisper.modelPath},
            {"language", asr.whisper.language},
            {"threads", asr.whisper.threads},
            {"no_speech_threshold", asr.whisper.noSpeechThreshold}
        }},
        {"llm", {
            {"url", llm.url},
            {"model", llm.model},
            {"temperature", llm.temperature},
            {"max_tokens", llm.maxTokens},
            {"max_history", llm.maxHistory}
        }},
        {"tts", {
            {"enabled", tts.enabled},
            {"url", tts.http.url},
            {"health_url", tts.http.healthUrl},
            {"timeout_ms", tts.http.timeoutMs},
            {"voice", tts.player.voice},
            {"custom_voice_id", tts.player.customVoiceId},
            {"speed", tts.player.speed},
            {"gain", tts.player.gain}
        }},
        {"vad", {
            {"enabled", vad.enabled},
            {"type", toString(vad.type)},
            {"ignore_ms", vad.base.ignoreMs},
            {"threshold", vad.amplitude.threshold},
            {"trigger_count", vad.amplitude.triggerCount},
            {"spectral_threshold", vad.spectral.threshold},
            {"speech_freq_ratio", vad.spectral.speechFreqRatio},
            {"speech_frames", vad.spectral.speechFrames},
            {"silence_frames", vad.spectral.silenceFrames},
            {"backend_url", vad.backendUrl},
            {"server_url", vad.serverUrl}
        }},
        {"recorder", {
            {"silence_threshold", recorder.silenceThreshold},
            {"silence_duration_ms", recorder.silenceDurationMs},
            {"max_recording_ms", recorder.maxRecordingMs}
        }},
        {"audio", {
            {"input_device", audio.input.device},
            {"output_device", audio.output.device},
            {"sample_rate", audio.input.sampleRate},
            {"frames_per_buffer", audio.input.framesPerBuffer}
        }},
        {"call", {
            {"barge_in_grace_ms", call.bargeInGraceMs}
        }},
        {"assistant", {
            {"name", assistant.name},
            {"aliases", assistant.aliases},
            {"stop_words", assistant.stopWords},
            {"interrupt_words", assistant.interruptWords}
        }},
        {"control", {
            {"bind_ip", control.bindIp},
            {"port", control.port}
        }}
    };
    return j.dump(2);
}

void Settings::save(const std::string& path) const {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("config: cannot write " + path);
    out << toJson() << "\n";
    if (!out) throw std::runtime_error("config: write failed for " + path);
}

std::vector<std::string> Settings::interruptWords() const {
    return KeywordGate::buildWordList(assistant.name, assistant.aliases, assistant.stopWords);
}
