#include "asr/http_transcriber.hpp"

#include <nlohmann/json.hpp>

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
HttpTranscriber::HttpTranscriber(Config config)
    : config_(std::move(config)), http_(httpConfig(config_.timeoutMs)) {}

TranscriptResult HttpTranscriber::transcribe(const AudioBytes& audio) {
    HttpResponse res = http_.postMultipart(config_.url, "audio", "recording.wav", "audio/wav", audio);
    if (!res.ok()) throw std::runtime_error("ASR error, status " + std::to_string(res.status));
    return parseResult(res.body);
}

bool HttpTranscriber::healthy() const {
    try {
        HttpResponse res = http_.get(config_.healthUrl);
        if (!res.ok()) return false;
        json j = json::parse(res.body, nullptr, false);
        return j.is_object() && j.value("status", std::string()) == "healthy";
    } catch (const std::exception& e) {
        std::cerr << "[ASR] [WARN] health check failed: " << e.what() << std::endl;
        return false;
    }
}

TranscriptResult HttpTranscriber::parseResult(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw std::runtime_error("ASR reply is not a JSON object");

    TranscriptResult out;
    out.success = j.value("success", false);
    if (j.contains("text") && j["text"].is_string()) out.text = j["text"].get<std::string>();

    if (j.contains("segments") && j["segments"].is_array()) {
        for (const auto& s : j["segments"]) {
            if (!s.is_object()) continue;
            TranscriptSegment seg;
            seg.start = s.value("start", 0.0);
            seg.end = s.value("end", 0.0);
            seg.text = s.value("text", std::string());
            out.segments.push_back(std::move(seg));
        }
    }
    return out;
}
