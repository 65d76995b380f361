#include "control/control_channel.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <unistd.h>
#endif

using json = nlohmann::json;

#ifdef _WIN32
static void closesock(socket_t s) { ::closesocket(s); }
static int lastSocketError() { return WSAGetLastError(); }
#else
static void closesock(socket_t s) { ::close(s); }
static const char* lastSocketError() { return std::strerror(errno); }
#endif

// Constructor
ControlChannel::ControlChannel(std::string bindIp, int port, Callback callback)
    : bindIp_(std::move(bindIp)), port_(port), callback_(std::move(callback)) {}

// Destructor
ControlChannel::~ControlChannel() { stop(); }

void ControlChannel::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&ControlChannel::run, this);
}

void ControlChannel::stop() {
    if (!running_.exchange(false)) return;

    const socket_t s = sock_.exchange(kInvalidSocket);
    if (s != kInvalidSocket) {
#ifdef _WIN32
        ::shutdown(s, SD_BOTH);
#else
        ::shutdown(s, SHUT_RDWR);
#endif
        closesock(s);
    }

    if (thread_.joinable()) thread_.join();
}

void ControlChannel::setActiveClient(const std::string& ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    activeIp_ = ip;
    activePort_ = port;
    hasActiveClient_ = true;
}

bool ControlChannel::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    const socket_t s = sock_.load();
    if (s == kInvalidSocket) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

#ifdef _WIN32
    int n = ::sendto(s, payload.data(), (int)payload.size(), 0,
                     reinterpret_cast<sockaddr*>(&addr), (int)sizeof(addr));
    return n == (int)payload.size();
#else
    ssize_t n = ::sendto(s, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == (ssize_t)payload.size();
#endif
}

bool ControlChannel::sendToActive(const std::string& payload) {
    std::string ip;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(clientMutex_);
        if (!hasActiveClient_) return false;
        ip = activeIp_;
        port = activePort_;
    }
    return sendTo(ip, port, payload);
}

bool ControlChannel::sendStatus(const CallStatus& status) {
    return sendToActive(statusJson(status));
}

// Tells the client the call has returned to Idle
bool ControlChannel::sendSessionDone() {
    json msg = {{"type", "session_done"}, {"ts", (double)std::time(nullptr)}};
    return sendToActive(msg.dump());
}

ControlMessage ControlChannel::parse(const std::string& text) {
    ControlMessage out;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return out;

    const std::string type = j.value("type", "");
    if (type == "start_call") out.type = ControlMessage::Type::StartCall;
    else if (type == "end_call") out.type = ControlMessage::Type::EndCall;
    else if (type == "interrupt") out.type = ControlMessage::Type::Interrupt;
    else if (type == "status") out.type = ControlMessage::Type::Status;
    else if (type == "set_vad") {
        auto it = j.find("vad_type");
        if (it == j.end() || !it->is_string()) return out;
        out.type = ControlMessage::Type::SetVad;
        out.vadType = it->get<std::string>();
    } else if (type == "set_gain") {
        auto it = j.find("gain");
        if (it == j.end() || !it->is_number()) return out;
        out.type = ControlMessage::Type::SetGain;
        out.gain = it->get<float>();
    }
    return out;
}

std::string ControlChannel::statusJson(const CallStatus& status) {
    json msg = {
        {"type", "status"},
        {"state", toString(status.state)},
        {"text", status.text},
        {"error", status.error}
    };
    return msg.dump();
}

// Receive loop; every datagram is parsed and handed to the callback
void ControlChannel::run() {
#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) {
        std::cerr << "[Control] [ERROR] WSAStartup failed" << std::endl;
        running_ = false;
        return;
    }
#endif

    socket_t s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s == kInvalidSocket) {
        std::cerr << "[Control] [ERROR] socket() failed: " << lastSocketError() << std::endl;
        running_ = false;
#ifdef _WIN32
        WSACleanup();
#endif
        return;
    }

    int reuse = 1;
#ifdef _WIN32
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
#else
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    bool bound = ::inet_pton(AF_INET, bindIp_.c_str(), &addr.sin_addr) == 1;
    if (!bound) {
        std::cerr << "[Control] [ERROR] invalid bind ip: " << bindIp_ << std::endl;
    } else if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "[Control] [ERROR] bind() failed: " << lastSocketError() << std::endl;
        bound = false;
    }
    if (!bound) {
        closesock(s);
        running_ = false;
#ifdef _WIN32
        WSACleanup();
#endif
        return;
    }

    sock_ = s;
    std::cout << "[Control] Listening on " << bindIp_ << ":" << port_ << std::endl;

    while (running_.load()) {
        char buff[2048];
        sockaddr_in src{};
#ifdef _WIN32
        int slen = sizeof(src);
        const int n = ::recvfrom(s, buff, (int)sizeof(buff) - 1, 0,
                                 reinterpret_cast<sockaddr*>(&src), &slen);
#else
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(s, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
#endif

        if (n <= 0) break;
        buff[n] = '\0';

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        std::string senderIp = ok ? std::string(ipstr) : std::string("127.0.0.1");
        uint16_t senderPort = ntohs(src.sin_port);

        setActiveClient(senderIp, senderPort);

        const ControlMessage msg = parse(std::string(buff, static_cast<size_t>(n)));
        if (msg.type == ControlMessage::Type::Unknown) {
            std::cerr << "[Control] [WARN] Ignoring datagram: " << buff << std::endl;
            continue;
        }

        try {
            if (callback_) callback_(msg, senderIp, senderPort);
        } catch (const std::exception& e) {
            std::cerr << "[Control] [ERROR] Handler threw: " << e.what() << std::endl;
        }
    }

    const socket_t left = sock_.exchange(kInvalidSocket);
    if (left != kInvalidSocket) closesock(left);

#ifdef _WIN32
    WSACleanup();
#endif
}
