#ifndef CALL_EVENTS_HPP
#define CALL_EVENTS_HPP

#include <string>
#include <utility>

enum class CallState {
    Idle,
    Listening,
    Recording,
    Processing,
    Speaking
};

struct CallEvent {
    enum class Type {
        StartCall,
        EndCall,
        VoiceDetected,
        SilenceDetected,
        AsrComplete,
        AsrEmpty,
        LlmComplete,
        TtsStarted,
        TtsEnded,
        Interrupted
    };

    Type type;
    std::string text;  // AsrComplete only

    static CallEvent of(Type t) { return CallEvent{t, {}}; }
    static CallEvent asrComplete(std::string text) { return CallEvent{Type::AsrComplete, std::move(text)}; }
};

enum class VadMode {
    Direct,
    KeywordGated
};

enum class VadStatus {
    Stopped,
    Loading,
    Connecting,
    Active,
    Verifying
};

struct VadEvent {
    enum class Kind {
        SpeechStart,
        SpeechEnd,
        StatusChanged
    };

    Kind kind;
    VadStatus status = VadStatus::Stopped;
    std::string keyword;  // set on a keyword-verified SpeechStart
};

struct RecorderEvent {
    enum class Kind {
        SilenceDetected,
        InputFailed     // the microphone stream died mid-recording
    };

    Kind kind;
    std::string error;
};

struct TtsEvent {
    enum class Kind {
        PlaybackStarted,
        QueueDrained
    };

    Kind kind;
    std::string text;
};

// User-visible trace of the call
struct CallStatus {
    CallState state = CallState::Idle;
    std::string text;
    std::string error;
};

const char* toString(CallState state);
const char* toString(CallEvent::Type type);
const char* toString(VadStatus status);

#endif
