#include "vad/vad_factory.hpp"

#include <stdexcept>
#include <utility>

VadType parseVadType(const std::string& name) {
    if (name == "amplitude" || name == "simple") return VadType::Amplitude;
    if (name == "spectral" || name == "webrtc") return VadType::Spectral;
    if (name == "backend" || name == "silero") return VadType::SocketBackend;
    if (name == "server" || name == "funasr") return VadType::SocketServer;
    throw std::invalid_argument("Unknown VAD type: " + name);
}

const char* toString(VadType type) {
    switch (type) {
        case VadType::Amplitude: return "amplitude";
        case VadType::Spectral: return "spectral";
        case VadType::SocketBackend: return "backend";
        case VadType::SocketServer: return "server";
    }
    return "unknown";
}

std::unique_ptr<VadBackend> makeVadBackend(const VadSettings& settings,
                                           AudioInputFactory inputFactory,
                                           WebSocketFactory socketFactory,
                                           EventSink<VadEvent>* sink,
                                           KeywordGate* gate) {
    switch (settings.type) {
        case VadType::Amplitude:
            return std::make_unique<AmplitudeVad>(settings.amplitude, settings.base, std::move(inputFactory),
                                                  sink, gate);

        case VadType::Spectral:
            return std::make_unique<SpectralVad>(settings.spectral, settings.base, std::move(inputFactory),
                                                 sink, gate);

        case VadType::SocketBackend: {
            SocketVad::Config c;
            c.variant = SocketVad::Variant::Backend;
            c.url = settings.backendUrl;
            return std::make_unique<SocketVad>(c, settings.base, std::move(inputFactory),
                                               std::move(socketFactory), sink, gate);
        }

        case VadType::SocketServer: {
            SocketVad::Config c;
            c.variant = SocketVad::Variant::Server;
            c.url = settings.serverUrl;
            return std::make_unique<SocketVad>(c, settings.base, std::move(inputFactory),
                                               std::move(socketFactory), sink, gate);
        }
    }
    throw std::invalid_argument("Unhandled VAD type");
}
