#include "vad/socket_vad.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace {
const char* variantName(SocketVad::Variant v) {
    return v == SocketVad::Variant::Backend ? "backend" : "server";
}
}  // namespace

// Constructor
SocketVad::SocketVad(Config config, VadBackend::Config base, AudioInputFactory inputFactory,
                     WebSocketFactory socketFactory, EventSink<VadEvent>* sink, KeywordGate* gate)
    : VadBackend(std::string("socket-") + variantName(config.variant), base, std::move(inputFactory), sink, gate),
      config_(std::move(config)),
      socketFactory_(std::move(socketFactory)) {}

// Destructor
SocketVad::~SocketVad() { shutdown(); }

std::string SocketVad::configFrame() {
    json config = {
        {"mode", "online"},
        {"chunk_size", {5, 10, 5}},
        {"wav_name", "vad"},
        {"is_speaking", true},
        {"chunk_interval", 10},
        {"itn", false},
        {"wav_format", "pcm"}
    };
    return config.dump();
}

std::string SocketVad::endFrame() {
    return json{{"is_speaking", false}}.dump();
}

// Opens the socket; Loading or Connecting holds until the config frame is sent
void SocketVad::startBackend() {
    if (!socketFactory_) throw std::runtime_error("VAD " + name() + ": no socket factory");

    setStatus(config_.variant == Variant::Backend ? VadStatus::Loading : VadStatus::Connecting);
    closing_ = false;

    std::unique_ptr<WebSocketConnection> socket = socketFactory_();
    WebSocketConnection::Handlers handlers;
    handlers.onOpen = [this] { onOpen(); };
    handlers.onText = [this](const std::string& text) { handleMessage(text, Clock::now()); };
    handlers.onClose = [this](const std::string& reason) { onClose(reason); };

    WebSocketConnection* raw = socket.get();
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket_ = std::move(socket);
    }

    std::cout << "[VAD:" << name() << "] Connecting to " << config_.url << std::endl;
    try {
        raw->connect(config_.url, std::move(handlers));
    } catch (...) {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket_.reset();
        throw;
    }
}

void SocketVad::stopBackend() {
    std::unique_ptr<WebSocketConnection> socket;
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket = std::move(socket_);
    }
    if (!socket) return;

    closing_ = true;
    if (socket->isOpen()) socket->sendText(endFrame());
    socket->close();
}

void SocketVad::onOpen() {
    bool sent = false;
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        if (socket_) sent = socket_->sendText(configFrame());
    }
    if (!sent) {
        std::cerr << "[VAD:" << name() << "] [ERROR] Could not send config frame" << std::endl;
        return;
    }

    armIgnoreWindow(Clock::now());
    setStatus(VadStatus::Active);
    std::cout << "[VAD:" << name() << "] Connected, config sent" << std::endl;
}

void SocketVad::onClose(const std::string& reason) {
    if (closing_.load()) return;
    std::cerr << "[VAD:" << name() << "] [ERROR] Socket closed: " << reason << std::endl;
    setStatus(VadStatus::Stopped);
}

void SocketVad::process(const int16_t* pcm16k, size_t n, Clock::time_point) {
    if (status() != VadStatus::Active && status() != VadStatus::Verifying) return;

    std::lock_guard<std::mutex> lock(socketMutex_);
    if (!socket_ || !socket_->isOpen()) return;

    frame_.resize(n * 2);
    for (size_t i = 0; i < n; ++i) {
        const uint16_t s = (uint16_t)pcm16k[i];
        frame_[2 * i] = (uint8_t)(s & 0xff);
        frame_[2 * i + 1] = (uint8_t)(s >> 8);
    }
    socket_->sendBinary(frame_.data(), frame_.size());
}

void SocketVad::handleMessage(const std::string& text, Clock::time_point now) {
    if (inIgnoreWindow(now)) return;

    json reply = json::parse(text, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        std::cerr << "[VAD:" << name() << "] [WARN] Malformed reply dropped: " << text.substr(0, 100) << std::endl;
        return;
    }

    std::string said;
    auto it = reply.find("text");
    if (it != reply.end() && it->is_string()) said = it->get<std::string>();

    bool isFinal = false;
    it = reply.find("is_final");
    if (it != reply.end() && it->is_boolean()) isFinal = it->get<bool>();

    if (!said.empty() && !isSpeaking()) reportSpeechStart(now);
    if (isFinal || (said.empty() && isSpeaking())) reportSpeechEnd(now);
}
