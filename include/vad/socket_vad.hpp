#ifndef SOCKET_VAD_HPP
#define SOCKET_VAD_HPP

#include "net/websocket_client.hpp"
#include "vad/vad_backend.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Neural VAD running behind a WebSocket. After a JSON config frame the client
// streams 16 kHz little-endian PCM16 and the server answers {text, is_final}:
// non-empty text marks speech, is_final or empty text marks its end.
class SocketVad : public VadBackend {
public:
    enum class Variant {
        Backend,    // model hosted by the application backend (/ws/vad)
        Server      // dedicated streaming VAD server
    };

    struct Config {
        Variant variant = Variant::Server;
        std::string url = "ws://127.0.0.1:10096";
    };

    SocketVad(Config config, VadBackend::Config base, AudioInputFactory inputFactory,
              WebSocketFactory socketFactory, EventSink<VadEvent>* sink, KeywordGate* gate);
    ~SocketVad() override;

    // Server reply; also driven directly by tests
    void handleMessage(const std::string& text, Clock::time_point now);

    static std::string configFrame();
    static std::string endFrame();

protected:
    void startBackend() override;
    void stopBackend() override;
    bool activeOnStart() const override { return false; }
    void process(const int16_t* pcm16k, size_t n, Clock::time_point now) override;

private:
    void onOpen();
    void onClose(const std::string& reason);

    Config config_;
    WebSocketFactory socketFactory_;

    std::mutex socketMutex_;
    std::unique_ptr<WebSocketConnection> socket_;
    std::atomic<bool> closing_{false};
    std::vector<uint8_t> frame_;
};

#endif
