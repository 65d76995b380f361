#ifndef VAD_FACTORY_HPP
#define VAD_FACTORY_HPP

#include "net/websocket_client.hpp"
#include "vad/amplitude_vad.hpp"
#include "vad/socket_vad.hpp"
#include "vad/spectral_vad.hpp"

#include <memory>
#include <string>

enum class VadType {
    Amplitude,
    Spectral,
    SocketBackend,
    SocketServer
};

// Accepts "amplitude" ("simple"), "spectral" ("webrtc"), "backend"
// ("silero") and "server" ("funasr"). Throws std::invalid_argument.
VadType parseVadType(const std::string& name);
const char* toString(VadType type);

struct VadSettings {
    bool enabled = true;
    VadType type = VadType::Spectral;
    VadBackend::Config base;
    AmplitudeVad::Config amplitude;
    SpectralVad::Config spectral;
    std::string backendUrl = "ws://127.0.0.1:6002/ws/vad";
    std::string serverUrl = "ws://127.0.0.1:10096";
};

std::unique_ptr<VadBackend> makeVadBackend(const VadSettings& settings,
                                           AudioInputFactory inputFactory,
                                           WebSocketFactory socketFactory,
                                           EventSink<VadEvent>* sink,
                                           KeywordGate* gate);

#endif
