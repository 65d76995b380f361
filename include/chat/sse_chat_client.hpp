#ifndef SSE_CHAT_CLIENT_HPP
#define SSE_CHAT_CLIENT_HPP

#include "chat/chat_service.hpp"
#include "net/http_client.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// POST {message, history, model, temperature, max_tokens}, then reads
// "data: {type, ...}" lines. Keeps the last maxHistory messages.
class SseChatClient : public ChatService {
public:
    struct Config {
        std::string url = "http://127.0.0.1:6002/api/chat";
        std::string model;
        double temperature = 0.7;
        int maxTokens = 1500;
        size_t maxHistory = 20;
    };

    explicit SseChatClient(Config config);

    ChatReply chat(const std::string& message, const TokenCallback& onToken,
                   const CancelToken& cancel) override;
    void abort() override;
    bool busy() const override { return busy_.load(); }

    std::vector<ChatMessage> history() const;
    void clearHistory();

    std::string requestBody(const std::string& message) const;

    // Returns false for frames that are not JSON objects
    static bool parseFrame(const std::string& payload, ChatFrame& out);

private:
    void remember(const std::string& role, const std::string& content);
    void finishRequest();

    Config config_;
    HttpClient http_;

    mutable std::mutex historyMutex_;
    std::deque<ChatMessage> history_;

    // Guards busy_ and current_ together so abort() always finds the token
    // of the request that is running
    std::mutex requestMutex_;
    std::atomic<bool> busy_{false};
    CancelToken current_;
};

#endif
