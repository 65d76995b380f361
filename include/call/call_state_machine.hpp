#ifndef CALL_STATE_MACHINE_HPP
#define CALL_STATE_MACHINE_HPP

#include "asr/transcriber.hpp"
#include "call/call_services.hpp"
#include "chat/chat_service.hpp"
#include "core/call_events.hpp"
#include "core/event_loop.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

// Turn-taking controller for one voice call.
//
// Every method runs on the loop thread. Transcription and chat run on the
// worker loop and post their results back tagged with the turn they belong
// to; results from an abandoned turn are dropped. While a transition is in
// flight (including the barge-in grace delay) every event except EndCall is
// dropped.
class CallStateMachine {
public:
    struct Config {
        int bargeInGraceMs = 200;
        bool ttsEnabled = true;
        bool interruptWords = false;   // keyword-gated barge-in while speaking
    };

    struct Services {
        RecorderService* recorder = nullptr;
        VadService* vad = nullptr;           // null when VAD is disabled
        SpeechService* speech = nullptr;
        Transcriber* transcriber = nullptr;
        ChatService* chat = nullptr;
    };

    using StatusCallback = std::function<void(const CallStatus&)>;

    CallStateMachine(Config config, Services services, EventLoop& loop, EventLoop& worker,
                     StatusCallback onStatus);
    ~CallStateMachine();

    CallStateMachine(const CallStateMachine&) = delete;
    CallStateMachine& operator=(const CallStateMachine&) = delete;

    void dispatch(const CallEvent& event);

    void startCall();
    void endCall();
    void onVoiceDetected();
    void onSilenceDetected();
    void onTtsEnded();
    void interrupt();

    // Typed channel handlers
    void handleVadEvent(const VadEvent& event);
    void handleRecorderEvent(const RecorderEvent& event);
    void handleTtsEvent(const TtsEvent& event);

    CallState state() const { return state_.load(); }
    CallStatus status() const;
    uint64_t turn() const { return turn_; }
    bool llmFinished() const { return llmFinished_; }
    bool transitioning() const { return transitioning_; }

    void setConfig(Config config) { config_ = config; }

private:
    void handle(const CallEvent& event);

    void enterIdle();
    void enterListening();
    void enterRecording(bool fromVadFailure);
    void enterProcessing();
    void enterSpeaking();
    void bargeIn();

    void submitChat(const std::string& text);
    void onTranscript(uint64_t turn, const TranscriptResult& result, const std::string& error);
    void onSentence(uint64_t turn, const std::string& sentence);
    void onChatFinished(uint64_t turn, const std::string& error, bool aborted);
    void cancelChat();
    void onRecorderFailed(const std::string& error);

    bool vadEnabled() const { return services_.vad != nullptr; }
    void attachVad(VadMode mode);
    void detachVad();
    bool speechBusy() const;

    void setState(CallState state);
    void setStatusText(const std::string& text);
    void setError(const std::string& error);
    void publish();

    Config config_;
    Services services_;
    EventLoop& loop_;
    EventLoop& worker_;
    StatusCallback onStatus_;

    std::atomic<CallState> state_{CallState::Idle};
    std::string statusText_;
    std::string error_;

    uint64_t turn_ = 0;
    bool llmFinished_ = false;
    bool transitioning_ = false;
    bool vadAttached_ = false;
    EventLoop::TimerId graceTimer_ = 0;
    CancelToken chatCancel_;
};

#endif
