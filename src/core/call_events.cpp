#include "core/call_events.hpp"

const char* toString(CallState state) {
    switch (state) {
        case CallState::Idle: return "idle";
        case CallState::Listening: return "listening";
        case CallState::Recording: return "recording";
        case CallState::Processing: return "processing";
        case CallState::Speaking: return "speaking";
    }
    return "unknown";
}

const char* toString(CallEvent::Type type) {
    switch (type) {
        case CallEvent::Type::StartCall: return "StartCall";
        case CallEvent::Type::EndCall: return "EndCall";
        case CallEvent::Type::VoiceDetected: return "VoiceDetected";
        case CallEvent::Type::SilenceDetected: return "SilenceDetected";
        case CallEvent::Type::AsrComplete: return "AsrComplete";
        case CallEvent::Type::AsrEmpty: return "AsrEmpty";
        case CallEvent::Type::LlmComplete: return "LlmComplete";
        case CallEvent::Type::TtsStarted: return "TtsStarted";
        case CallEvent::Type::TtsEnded: return "TtsEnded";
        case CallEvent::Type::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

const char* toString(VadStatus status) {
    switch (status) {
        case VadStatus::Stopped: return "stopped";
        case VadStatus::Loading: return "loading";
        case VadStatus::Connecting: return "connecting";
        case VadStatus::Active: return "active";
        case VadStatus::Verifying: return "verifying";
    }
    return "unknown";
}
