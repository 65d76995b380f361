#ifndef VOICE_CALL_SESSION_HPP
#define VOICE_CALL_SESSION_HPP

#include "asr/transcriber.hpp"
#include "audio/audio_device.hpp"
#include "audio/audio_recorder.hpp"
#include "call/call_state_machine.hpp"
#include "chat/chat_service.hpp"
#include "config/settings.hpp"
#include "core/event_loop.hpp"
#include "core/event_sink.hpp"
#include "net/websocket_client.hpp"
#include "tts/streaming_tts_player.hpp"
#include "tts/synthesizer.hpp"
#include "vad/keyword_gate.hpp"
#include "vad/vad_controller.hpp"

#include <functional>
#include <memory>
#include <mutex>

// Owns one call and everything it runs on: the call loop, the ASR/chat
// worker, the interrupt-word worker and the services wired between them.
class VoiceCallSession {
public:
    // Device and network endpoints; tests substitute fakes
    struct Components {
        AudioInputFactory inputFactory;
        std::function<std::unique_ptr<AudioOutput>()> outputFactory;
        WebSocketFactory socketFactory;
        std::shared_ptr<Transcriber> transcriber;
        std::shared_ptr<Synthesizer> synthesizer;
        std::shared_ptr<ChatService> chat;
    };

    using StatusListener = std::function<void(const CallStatus&)>;

    VoiceCallSession(Settings settings, Components components);
    ~VoiceCallSession();

    VoiceCallSession(const VoiceCallSession&) = delete;
    VoiceCallSession& operator=(const VoiceCallSession&) = delete;

    // PortAudio devices, libwebsockets sockets and the configured ASR backend
    static Components defaultComponents(const Settings& settings);

    // Builds the services and starts the loops. Throws std::runtime_error.
    void init();
    void dispose();

    // Safe from any thread; queued onto the call loop
    void startCall();
    void endCall();
    void interrupt();
    void setVadType(VadType type);
    void setGain(float gain);

    void setStatusListener(StatusListener listener);
    CallStatus status() const;

    bool initialized() const { return initialized_; }
    EventLoop& loop() { return loop_; }

private:
    void onStatus(const CallStatus& status);

    Settings settings_;
    Components components_;

    EventLoop loop_;
    EventLoop worker_;
    EventLoop gateWorker_;

    std::unique_ptr<LoopSink<VadEvent>> vadSink_;
    std::unique_ptr<LoopSink<RecorderEvent>> recorderSink_;
    std::unique_ptr<LoopSink<TtsEvent>> ttsSink_;

    std::unique_ptr<KeywordGate> gate_;
    std::unique_ptr<VadController> vad_;
    std::unique_ptr<AudioRecorder> recorder_;
    std::unique_ptr<StreamingTtsPlayer> player_;
    std::unique_ptr<CallStateMachine> machine_;

    mutable std::mutex statusMutex_;
    CallStatus status_;
    StatusListener listener_;

    bool initialized_ = false;
};

#endif
