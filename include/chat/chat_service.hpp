#ifndef CHAT_SERVICE_HPP
#define CHAT_SERVICE_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>

struct ChatMessage {
    std::string role;     // "user" or "assistant"
    std::string content;
};

struct ChatFrame {
    enum class Type {
        Token,
        SkillStart,
        SkillEnd,
        Error,
        Music,
        Done,
        Unknown
    };

    Type type = Type::Unknown;
    std::string content;   // Token
    std::string name;      // SkillStart, SkillEnd
    std::string input;     // SkillStart, raw JSON
    std::string output;    // SkillEnd
    std::string message;   // Error
    std::string action;    // Music
};

struct ChatReply {
    std::string text;
    bool aborted = false;
};

// Set to cancel one request. A request whose token is already set when it
// reaches the client is never sent.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken makeCancelToken() { return std::make_shared<std::atomic<bool>>(false); }

// Streaming language-model client. chat() blocks on a worker; abort() may be
// called from any thread, cancels the request in flight and is a no-op when
// nothing is in flight.
class ChatService {
public:
    using TokenCallback = std::function<void(const std::string& token)>;

    virtual ~ChatService() = default;

    // Throws std::runtime_error on transport or HTTP failure, or when the
    // stream reports an error before producing any text. A null cancel gets a
    // fresh token.
    virtual ChatReply chat(const std::string& message, const TokenCallback& onToken,
                           const CancelToken& cancel) = 0;
    virtual void abort() = 0;
    virtual bool busy() const = 0;
};

#endif
