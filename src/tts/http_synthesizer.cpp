#include "tts/http_synthesizer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace {
HttpClient::Config httpConfig(long timeoutMs) {
    HttpClient::Config c;
    c.timeoutMs = timeoutMs;
    return c;
}
}  // namespace

// Constructor
HttpSynthesizer::HttpSynthesizer(Config config)
    : config_(std::move(config)), http_(httpConfig(config_.timeoutMs)) {}

double HttpSynthesizer::clampSpeed(double speed) {
    return std::max(0.5, std::min(2.0, speed));
}

std::string HttpSynthesizer::requestBody(const SynthesisRequest& request) {
    json body = {
        {"text", request.text},
        {"voice", request.voice.empty() ? std::string("alex") : request.voice},
        {"speed", clampSpeed(request.speed)},
        {"response_format", request.format}
    };
    if (!request.customVoiceId.empty()) body["custom_voice_id"] = request.customVoiceId;
    return body.dump();
}

AudioBytes HttpSynthesizer::synthesize(const SynthesisRequest& request) {
    HttpResponse res = http_.postJson(config_.url, requestBody(request));
    if (!res.ok()) throw std::runtime_error("TTS error, status " + std::to_string(res.status));
    if (res.contentType.find("json") != std::string::npos) {
        throw std::runtime_error("TTS returned JSON instead of audio: " + res.body.substr(0, 200));
    }
    return AudioBytes(res.body.begin(), res.body.end());
}

bool HttpSynthesizer::healthy() const {
    try {
        HttpResponse res = http_.get(config_.healthUrl);
        if (!res.ok()) return false;
        json j = json::parse(res.body, nullptr, false);
        return j.is_object() && j.value("status", std::string()) == "healthy";
    } catch (const std::exception& e) {
        std::cerr << "[TTS] [WARN] health check failed: " << e.what() << std::endl;
        return false;
    }
}
