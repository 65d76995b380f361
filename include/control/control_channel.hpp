#ifndef CONTROL_CHANNEL_HPP
#define CONTROL_CHANNEL_HPP

#include "core/call_events.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

// One datagram from a UI client: {"type": "start_call" | "end_call" |
// "interrupt" | "status" | "set_vad" | "set_gain", ...}
struct ControlMessage {
    enum class Type {
        StartCall,
        EndCall,
        Interrupt,
        Status,
        SetVad,
        SetGain,
        Unknown
    };

    Type type = Type::Unknown;
    std::string vadType;   // SetVad
    float gain = 0.0f;     // SetGain
};

// UDP control surface. The last sender becomes the active client and receives
// status updates.
class ControlChannel {
public:
    using Callback = std::function<void(const ControlMessage& msg,
                                        const std::string& senderIp,
                                        uint16_t senderPort)>;

    ControlChannel(std::string bindIp, int port, Callback callback);
    ~ControlChannel();

    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    void start();
    void stop();

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

    bool sendStatus(const CallStatus& status);
    bool sendSessionDone();

    // Unknown type for malformed datagrams
    static ControlMessage parse(const std::string& text);
    static std::string statusJson(const CallStatus& status);

private:
    void run();

    void setActiveClient(const std::string& ip, uint16_t port);

    std::string bindIp_;
    int port_;
    Callback callback_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<socket_t> sock_{kInvalidSocket};

    std::mutex clientMutex_;
    std::string activeIp_{"127.0.0.1"};
    uint16_t activePort_{0};
    bool hasActiveClient_{false};
};

#endif
