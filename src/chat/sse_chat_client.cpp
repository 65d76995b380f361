#include "chat/sse_chat_client.hpp"
#include "net/sse_parser.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace {
ChatFrame::Type frameType(const std::string& t) {
    if (t == "token") return ChatFrame::Type::Token;
    if (t == "skill_start") return ChatFrame::Type::SkillStart;
    if (t == "skill_end") return ChatFrame::Type::SkillEnd;
    if (t == "error") return ChatFrame::Type::Error;
    if (t == "music") return ChatFrame::Type::Music;
    if (t == "done") return ChatFrame::Type::Done;
    return ChatFrame::Type::Unknown;
}

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}
}  // namespace

// Constructor
SseChatClient::SseChatClient(Config config) : config_(std::move(config)) {}

bool SseChatClient::parseFrame(const std::string& payload, ChatFrame& out) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    out = ChatFrame{};
    out.type = frameType(stringField(j, "type"));
    out.content = stringField(j, "content");
    out.name = stringField(j, "name");
    out.input = stringField(j, "input");
    out.output = stringField(j, "output");
    out.message = stringField(j, "message");
    out.action = stringField(j, "action");
    return true;
}

std::string SseChatClient::requestBody(const std::string& message) const {
    json history = json::array();
    {
        std::lock_guard<std::mutex> lock(historyMutex_);
        for (const auto& m : history_) history.push_back({{"role", m.role}, {"content", m.content}});
    }

    json body = {
        {"message", message},
        {"history", history},
        {"temperature", config_.temperature},
        {"max_tokens", config_.maxTokens}
    };
    if (!config_.model.empty()) body["model"] = config_.model;
    return body.dump();
}

ChatReply SseChatClient::chat(const std::string& message, const TokenCallback& onToken,
                              const CancelToken& cancel) {
    ChatReply reply;
    const CancelToken token = cancel ? cancel : makeCancelToken();
    if (token->load()) {
        std::cout << "[Chat] Request cancelled before sending" << std::endl;
        reply.aborted = true;
        return reply;
    }

    {
        std::lock_guard<std::mutex> lock(requestMutex_);
        if (busy_.load()) throw std::runtime_error("Chat request already in flight");
        busy_ = true;
        current_ = token;
    }

    std::string streamError;
    SseParser parser;

    auto handle = [&](const std::string& payload) {
        ChatFrame frame;
        if (!parseFrame(payload, frame)) {
            std::cerr << "[Chat] [WARN] Malformed frame dropped: " << payload.substr(0, 100) << std::endl;
            return;
        }
        switch (frame.type) {
            case ChatFrame::Type::Token:
                if (frame.content.empty()) break;
                reply.text += frame.content;
                if (onToken) onToken(frame.content);
                break;
            case ChatFrame::Type::SkillStart:
                std::cout << "[Chat] Skill " << frame.name << " started" << std::endl;
                break;
            case ChatFrame::Type::SkillEnd:
                std::cout << "[Chat] Skill " << frame.name << " finished" << std::endl;
                break;
            case ChatFrame::Type::Error:
                std::cerr << "[Chat] [ERROR] " << frame.message << std::endl;
                streamError = frame.message.empty() ? "chat stream error" : frame.message;
                break;
            case ChatFrame::Type::Music:
                std::cout << "[Chat] Music action " << frame.action << " ignored" << std::endl;
                break;
            case ChatFrame::Type::Done:
            case ChatFrame::Type::Unknown:
                break;
        }
    };

    const std::string body = requestBody(message);
    remember("user", message);

    HttpResponse res;
    try {
        res = http_.postStream(config_.url, body, [&](const char* data, size_t size) {
            for (const auto& payload : parser.feed(data, size)) handle(payload);
        }, token.get());
        if (!res.aborted) {
            for (const auto& payload : parser.finish()) handle(payload);
        }
    } catch (...) {
        finishRequest();
        throw;
    }
    finishRequest();

    if (res.aborted || token->load()) {
        std::cout << "[Chat] Request aborted" << std::endl;
        reply.aborted = true;
        return reply;
    }
    if (!res.ok()) throw std::runtime_error("Chat error, status " + std::to_string(res.status));
    if (reply.text.empty() && !streamError.empty()) throw std::runtime_error(streamError);

    if (!reply.text.empty()) remember("assistant", reply.text);
    return reply;
}

void SseChatClient::abort() {
    std::lock_guard<std::mutex> lock(requestMutex_);
    if (!current_) return;
    std::cout << "[Chat] Aborting request" << std::endl;
    *current_ = true;
}

void SseChatClient::finishRequest() {
    std::lock_guard<std::mutex> lock(requestMutex_);
    current_.reset();
    busy_ = false;
}

std::vector<ChatMessage> SseChatClient::history() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return std::vector<ChatMessage>(history_.begin(), history_.end());
}

void SseChatClient::clearHistory() {
    std::lock_guard<std::mutex> lock(historyMutex_);
    history_.clear();
}

void SseChatClient::remember(const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(historyMutex_);
    history_.push_back(ChatMessage{role, content});
    while (history_.size() > config_.maxHistory) history_.pop_front();
}
