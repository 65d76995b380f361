#ifndef WEBSOCKET_CLIENT_HPP
#define WEBSOCKET_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct lws;
struct lws_context;

// Client-side WebSocket. Handlers run on the connection's service thread.
class WebSocketConnection {
public:
    struct Handlers {
        std::function<void()> onOpen;
        std::function<void(const std::string&)> onText;
        std::function<void(const std::string& reason)> onClose;
    };

    virtual ~WebSocketConnection() = default;

    // Starts the handshake. Throws std::runtime_error when the url is invalid
    // or the connection cannot be initiated; later failures arrive as onClose.
    virtual void connect(const std::string& url, Handlers handlers) = 0;

    virtual bool sendText(const std::string& text) = 0;
    virtual bool sendBinary(const uint8_t* data, size_t size) = 0;

    // Flushes queued frames, closes and joins the service thread
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

using WebSocketFactory = std::function<std::unique_ptr<WebSocketConnection>()>;

struct WebSocketUrl {
    bool secure = false;
    std::string host;
    int port = 80;
    std::string path = "/";
};

// Parses ws:// and wss:// urls. Throws std::invalid_argument otherwise.
WebSocketUrl parseWebSocketUrl(const std::string& url);

// libwebsockets implementation: one context and service thread per connection
class LwsWebSocket : public WebSocketConnection {
public:
    LwsWebSocket();
    ~LwsWebSocket() override;

    LwsWebSocket(const LwsWebSocket&) = delete;
    LwsWebSocket& operator=(const LwsWebSocket&) = delete;

    void connect(const std::string& url, Handlers handlers) override;
    bool sendText(const std::string& text) override;
    bool sendBinary(const uint8_t* data, size_t size) override;
    void close() override;
    bool isOpen() const override { return open_.load(); }

    // Entry from the protocol callback, on the service thread
    int handleCallback(struct lws* wsi, int reason, void* in, size_t len);

private:
    struct Frame {
        bool binary = false;
        std::vector<uint8_t> data;
    };

    bool enqueue(bool binary, const uint8_t* data, size_t size);
    void serviceLoop();

    int onWritable(struct lws* wsi);
    void onReceive(const char* data, size_t len, bool final);
    void onClosed(const std::string& reason);

    Handlers handlers_;
    WebSocketUrl url_;

    lws_context* context_ = nullptr;
    struct lws* wsi_ = nullptr;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    bool closeNotified_ = false;

    std::mutex writeMutex_;
    std::deque<Frame> outgoing_;

    std::string partial_;  // fragmented text message
};

std::unique_ptr<WebSocketConnection> makeLwsWebSocket();

#endif
