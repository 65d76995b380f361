#include "net/websocket_client.hpp"

#include <libwebsockets.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

int lwsCallback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len) {
    (void)user;
    auto* client = static_cast<LwsWebSocket*>(lws_context_user(lws_get_context(wsi)));
    if (!client) return 0;
    return client->handleCallback(wsi, (int)reason, in, len);
}

struct lws_protocols kProtocols[] = {
    {"voice-call", lwsCallback, 0, 64 * 1024, 0, nullptr, 0},
    {nullptr, nullptr, 0, 0, 0, nullptr, 0}
};

}  // namespace

WebSocketUrl parseWebSocketUrl(const std::string& url) {
    WebSocketUrl out;
    std::string rest;
    if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
        out.port = 80;
    } else if (url.rfind("wss://", 0) == 0) {
        rest = url.substr(6);
        out.secure = true;
        out.port = 443;
    } else {
        throw std::invalid_argument("Not a WebSocket url: " + url);
    }

    const size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.path = slash == std::string::npos ? "/" : rest.substr(slash);

    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        const std::string port = authority.substr(colon + 1);
        try {
            out.port = std::stoi(port);
        } catch (const std::exception&) {
            throw std::invalid_argument("Bad port in url: " + url);
        }
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) throw std::invalid_argument("Missing host in url: " + url);
    out.host = authority;
    return out;
}

// Constructor
LwsWebSocket::LwsWebSocket() = default;

// Destructor
LwsWebSocket::~LwsWebSocket() { close(); }

// Creates the lws context and starts the handshake on the service thread
void LwsWebSocket::connect(const std::string& url, Handlers handlers) {
    if (running_.load()) throw std::runtime_error("WebSocket already connected");

    url_ = parseWebSocketUrl(url);
    handlers_ = std::move(handlers);
    closing_ = false;
    closeNotified_ = false;
    partial_.clear();

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof info);
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = kProtocols;
    info.gid = -1;
    info.uid = -1;
    info.user = this;
    if (url_.secure) {
        info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
#ifdef __linux__
        info.client_ssl_ca_filepath = "/etc/ssl/certs/ca-certificates.crt";
#endif
    }

    context_ = lws_create_context(&info);
    if (!context_) throw std::runtime_error("Failed to create lws context");

    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof ccinfo);
    ccinfo.context = context_;
    ccinfo.address = url_.host.c_str();
    ccinfo.host = ccinfo.address;
    ccinfo.origin = ccinfo.address;
    ccinfo.port = url_.port;
    ccinfo.path = url_.path.c_str();
    ccinfo.protocol = nullptr;
    ccinfo.local_protocol_name = kProtocols[0].name;
    ccinfo.ssl_connection = url_.secure ? LCCSCF_USE_SSL : 0;

    wsi_ = lws_client_connect_via_info(&ccinfo);
    if (!wsi_) {
        lws_context_destroy(context_);
        context_ = nullptr;
        throw std::runtime_error("Failed to connect to " + url);
    }

    running_ = true;
    thread_ = std::thread(&LwsWebSocket::serviceLoop, this);
}

bool LwsWebSocket::sendText(const std::string& text) {
    return enqueue(false, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool LwsWebSocket::sendBinary(const uint8_t* data, size_t size) {
    return enqueue(true, data, size);
}

bool LwsWebSocket::enqueue(bool binary, const uint8_t* data, size_t size) {
    if (!open_.load() || closing_.load()) return false;

    Frame frame;
    frame.binary = binary;
    frame.data.resize(LWS_PRE + size);
    if (size) std::memcpy(frame.data.data() + LWS_PRE, data, size);
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        outgoing_.push_back(std::move(frame));
    }
    // Wakes lws_service so the writable callback can be requested from its thread
    lws_cancel_service(context_);
    return true;
}

// Gives queued frames a short window to flush, then tears the context down
void LwsWebSocket::close() {
    if (!running_.load()) return;

    closing_ = true;
    if (context_) lws_cancel_service(context_);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    while (open_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    running_ = false;
    if (context_) lws_cancel_service(context_);
    if (thread_.joinable()) thread_.join();

    if (context_) {
        lws_context_destroy(context_);
        context_ = nullptr;
    }
    wsi_ = nullptr;
    open_ = false;

    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        outgoing_.clear();
    }
    onClosed("closed by client");
}

void LwsWebSocket::serviceLoop() {
    while (running_.load()) {
        lws_service(context_, 50);
    }
}

int LwsWebSocket::handleCallback(struct lws* wsi, int reason, void* in, size_t len) {
    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED:
            open_ = true;
            if (handlers_.onOpen) handlers_.onOpen();
            lws_callback_on_writable(wsi);
            break;

        case LWS_CALLBACK_CLIENT_RECEIVE:
            if (in && len > 0 && !lws_frame_is_binary(wsi)) {
                onReceive(static_cast<const char*>(in), len, lws_is_final_fragment(wsi) != 0);
            }
            break;

        case LWS_CALLBACK_CLIENT_WRITEABLE:
            return onWritable(wsi);

        case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
            if (wsi_ && open_.load()) lws_callback_on_writable(wsi_);
            break;

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            std::string reason = (in && len > 0) ? std::string(static_cast<const char*>(in), len) : "connection error";
            std::cerr << "[WebSocket] [ERROR] " << reason << std::endl;
            wsi_ = nullptr;
            open_ = false;
            onClosed(reason);
            break;
        }

        case LWS_CALLBACK_CLIENT_CLOSED:
            wsi_ = nullptr;
            open_ = false;
            onClosed("closed by server");
            break;

        default:
            break;
    }
    return 0;
}

int LwsWebSocket::onWritable(struct lws* wsi) {
    Frame frame;
    bool more = false;
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (outgoing_.empty()) {
            if (closing_.load()) {
                lws_close_reason(wsi, LWS_CLOSE_STATUS_NORMAL, nullptr, 0);
                return -1;
            }
            return 0;
        }
        frame = std::move(outgoing_.front());
        outgoing_.pop_front();
        more = !outgoing_.empty() || closing_.load();
    }

    const size_t payload = frame.data.size() - LWS_PRE;
    const int n = lws_write(wsi, frame.data.data() + LWS_PRE, payload, frame.binary ? LWS_WRITE_BINARY : LWS_WRITE_TEXT);
    if (n < (int)payload) {
        std::cerr << "[WebSocket] [ERROR] lws_write failed" << std::endl;
        return -1;
    }

    if (more) lws_callback_on_writable(wsi);
    return 0;
}

void LwsWebSocket::onReceive(const char* data, size_t len, bool final) {
    partial_.append(data, len);
    if (!final) return;

    std::string message;
    message.swap(partial_);
    try {
        if (handlers_.onText) handlers_.onText(message);
    } catch (const std::exception& e) {
        std::cerr << "[WebSocket] [ERROR] message handler threw: " << e.what() << std::endl;
    }
}

void LwsWebSocket::onClosed(const std::string& reason) {
    if (closeNotified_) return;
    closeNotified_ = true;
    if (handlers_.onClose) handlers_.onClose(reason);
}

std::unique_ptr<WebSocketConnection> makeLwsWebSocket() {
    return std::make_unique<LwsWebSocket>();
}
