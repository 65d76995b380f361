#include "asr/http_transcriber.hpp"
#include "call/voice_call_session.hpp"
#include "config/settings.hpp"
#include "control/control_channel.hpp"
#include "tts/http_synthesizer.hpp"

#include <cstring>
#include <iostream>
#include <memory>
#include <string>

namespace {

void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>        settings file (default config.json)\n"
              << "  --vad <type>           amplitude | spectral | backend | server\n"
              << "  --no-vad               record directly after each turn\n"
              << "  --write-config <path>  write the effective settings and exit\n"
              << "  --list-devices         print audio devices and exit\n"
              << "  --help\n";
}

// Logs unreachable HTTP backends; the call still starts and fails per turn
void checkBackends(const Settings& settings) {
    if (settings.asr.backend == "http") {
        HttpTranscriber asr(settings.asr.http);
        if (!asr.healthy()) std::cerr << "[Main] [WARN] ASR service not reachable at " << settings.asr.http.healthUrl << std::endl;
    }
    if (settings.tts.enabled) {
        HttpSynthesizer tts(settings.tts.http);
        if (!tts.healthy()) std::cerr << "[Main] [WARN] TTS service not reachable at " << settings.tts.http.healthUrl << std::endl;
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::string configPath = "config.json";
    std::string vadOverride;
    std::string writePath;
    bool noVad = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--config" && hasValue) configPath = argv[++i];
        else if (arg == "--vad" && hasValue) vadOverride = argv[++i];
        else if (arg == "--write-config" && hasValue) writePath = argv[++i];
        else if (arg == "--no-vad") noVad = true;
        else if (arg == "--list-devices") {
            try {
                listAudioDevices();
            } catch (const std::exception& e) {
                std::cerr << "[Main] [ERROR] " << e.what() << std::endl;
                return 1;
            }
            return 0;
        } else if (arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    Settings settings;
    try {
        settings = Settings::load(configPath);
        if (!vadOverride.empty()) settings.vad.type = parseVadType(vadOverride);
        if (noVad) settings.vad.enabled = false;
        if (!writePath.empty()) {
            settings.save(writePath);
            std::cout << "[Main] Wrote " << writePath << std::endl;
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Main] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    checkBackends(settings);

    std::unique_ptr<VoiceCallSession> session;
    try {
        session = std::make_unique<VoiceCallSession>(settings, VoiceCallSession::defaultComponents(settings));
        session->init();
    } catch (const std::exception& e) {
        std::cerr << "[Main] [ERROR] Session init failed: " << e.what() << std::endl;
        return 1;
    }

    ControlChannel control(settings.control.bindIp, settings.control.port,
        [&](const ControlMessage& msg, const std::string& senderIp, uint16_t senderPort) {
        std::cout << "[Main] Control message from " << senderIp << ":" << senderPort << std::endl;
        switch (msg.type) {
            case ControlMessage::Type::StartCall: session->startCall(); break;
            case ControlMessage::Type::EndCall: session->endCall(); break;
            case ControlMessage::Type::Interrupt: session->interrupt(); break;
            case ControlMessage::Type::Status: control.sendStatus(session->status()); break;
            case ControlMessage::Type::SetVad: session->setVadType(parseVadType(msg.vadType)); break;
            case ControlMessage::Type::SetGain: session->setGain(msg.gain); break;
            case ControlMessage::Type::Unknown: break;
        }
    });

    CallState last = CallState::Idle;
    session->setStatusListener([&](const CallStatus& status) {
        std::cout << "[Status] " << toString(status.state) << " " << status.text;
        if (!status.error.empty()) std::cout << " (" << status.error << ")";
        std::cout << std::endl;

        control.sendStatus(status);
        if (status.state == CallState::Idle && last != CallState::Idle) control.sendSessionDone();
        last = status.state;
    });

    control.start();

    std::cout << "\nVoice call running. Commands: start, end, interrupt, quit" << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "start") session->startCall();
        else if (line == "end") session->endCall();
        else if (line == "interrupt") session->interrupt();
        else if (line == "quit" || line == "q") break;
        else if (!line.empty()) std::cout << "Unknown command: " << line << std::endl;
    }

    control.stop();
    session->dispose();
    return 0;
}
