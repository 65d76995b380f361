#include "call/call_state_machine.hpp"
#include "chat/sentence_segmenter.hpp"

#include <iostream>
#include <memory>
#include <utility>

namespace {
const char* kListening = "listening";
const char* kRecording = "recording";
const char* kThinking = "thinking";
const char* kSpeaking = "speaking";

const char* vadStatusText(VadStatus status) {
    switch (status) {
        case VadStatus::Loading: return "loading VAD model";
        case VadStatus::Connecting: return "connecting VAD";
        case VadStatus::Verifying: return "verifying interrupt word";
        default: return nullptr;
    }
}
}  // namespace

// Constructor
CallStateMachine::CallStateMachine(Config config, Services services, EventLoop& loop, EventLoop& worker,
                                   StatusCallback onStatus)
    : config_(config), services_(services), loop_(loop), worker_(worker), onStatus_(std::move(onStatus)) {}

// Destructor
CallStateMachine::~CallStateMachine() {
    if (graceTimer_) loop_.cancel(graceTimer_);
}

CallStatus CallStateMachine::status() const {
    CallStatus s;
    s.state = state_.load();
    s.text = statusText_;
    s.error = error_;
    return s;
}

void CallStateMachine::dispatch(const CallEvent& event) {
    if (transitioning_ && event.type != CallEvent::Type::EndCall) {
        std::cout << "[Call] Dropping " << toString(event.type) << " (transition in flight)" << std::endl;
        return;
    }

    const CallState before = state_.load();
    std::cout << "[Call] " << toString(before) << " + " << toString(event.type) << std::endl;

    transitioning_ = true;
    handle(event);
    // The barge-in grace timer keeps the transition open until it fires
    if (!graceTimer_) transitioning_ = false;

    if (state_.load() != before) std::cout << "[Call] -> " << toString(state_.load()) << std::endl;
}

void CallStateMachine::handle(const CallEvent& event) {
    using T = CallEvent::Type;

    if (event.type == T::EndCall) {
        if (state_.load() != CallState::Idle) enterIdle();
        return;
    }

    switch (state_.load()) {
        case CallState::Idle:
            if (event.type == T::StartCall) {
                error_.clear();
                try {
                    services_.speech->unlock();
                } catch (const std::exception& e) {
                    std::cerr << "[Call] [ERROR] Audio output unavailable: " << e.what() << std::endl;
                    setError(std::string("audio output unavailable: ") + e.what());
                    return;
                }
                enterListening();
            }
            break;

        case CallState::Listening:
            if (event.type == T::VoiceDetected) enterRecording(false);
            break;

        case CallState::Recording:
            if (event.type == T::SilenceDetected) enterProcessing();
            break;

        case CallState::Processing:
            if (event.type == T::TtsStarted) {
                enterSpeaking();
            } else if (event.type == T::AsrComplete) {
                submitChat(event.text);
            } else if (event.type == T::AsrEmpty) {
                std::cout << "[Call] No speech recognized, listening again" << std::endl;
                enterListening();
            } else if (event.type == T::LlmComplete) {
                llmFinished_ = true;
                if (!speechBusy()) enterListening();
            }
            break;

        case CallState::Speaking:
            if (event.type == T::LlmComplete) {
                llmFinished_ = true;
                // Playback may already have drained before the stream closed
                if (!speechBusy()) enterListening();
            } else if (event.type == T::TtsEnded) {
                if (llmFinished_ && !speechBusy()) enterListening();
            } else if (event.type == T::Interrupted) {
                bargeIn();
            }
            break;
    }
}

void CallStateMachine::startCall() { dispatch(CallEvent::of(CallEvent::Type::StartCall)); }

void CallStateMachine::endCall() { dispatch(CallEvent::of(CallEvent::Type::EndCall)); }

void CallStateMachine::onVoiceDetected() {
    if (state_.load() == CallState::Speaking) dispatch(CallEvent::of(CallEvent::Type::Interrupted));
    else if (state_.load() == CallState::Listening) dispatch(CallEvent::of(CallEvent::Type::VoiceDetected));
}

void CallStateMachine::onSilenceDetected() {
    if (state_.load() == CallState::Recording) dispatch(CallEvent::of(CallEvent::Type::SilenceDetected));
}

void CallStateMachine::onTtsEnded() {
    if (state_.load() == CallState::Speaking) dispatch(CallEvent::of(CallEvent::Type::TtsEnded));
}

void CallStateMachine::interrupt() {
    if (state_.load() == CallState::Speaking) dispatch(CallEvent::of(CallEvent::Type::Interrupted));
}

void CallStateMachine::handleVadEvent(const VadEvent& event) {
    switch (event.kind) {
        case VadEvent::Kind::SpeechStart:
            if (!event.keyword.empty()) std::cout << "[Call] Interrupt word \"" << event.keyword << "\"" << std::endl;
            onVoiceDetected();
            break;

        case VadEvent::Kind::SpeechEnd:
            break;

        case VadEvent::Kind::StatusChanged: {
            if (!vadAttached_ || !services_.vad) break;
            const VadStatus current = services_.vad->status();

            if (current == VadStatus::Stopped && state_.load() == CallState::Listening && !transitioning_) {
                std::cerr << "[Call] [ERROR] VAD stopped unexpectedly, recording instead" << std::endl;
                setError("VAD connection lost");
                transitioning_ = true;
                enterRecording(true);
                transitioning_ = false;
                break;
            }

            const char* text = vadStatusText(current);
            if (text) setStatusText(text);
            else if (state_.load() == CallState::Listening) setStatusText(kListening);
            else if (state_.load() == CallState::Speaking) setStatusText(kSpeaking);
            break;
        }
    }
}

void CallStateMachine::handleRecorderEvent(const RecorderEvent& event) {
    switch (event.kind) {
        case RecorderEvent::Kind::SilenceDetected:
            onSilenceDetected();
            break;
        case RecorderEvent::Kind::InputFailed:
            onRecorderFailed(event.error);
            break;
    }
}

// Same fallback as a failed start: Listening when a VAD can take over
void CallStateMachine::onRecorderFailed(const std::string& error) {
    if (state_.load() != CallState::Recording || transitioning_) return;

    std::cerr << "[Call] [ERROR] Recording lost: " << error << std::endl;
    setError("microphone lost: " + error);
    transitioning_ = true;
    try {
        services_.recorder->stopRecording();
    } catch (const std::exception& e) {
        std::cerr << "[Call] [WARN] Recorder stop failed: " << e.what() << std::endl;
    }
    if (vadEnabled()) enterListening();
    else enterIdle();
    transitioning_ = false;
    std::cout << "[Call] -> " << toString(state_.load()) << std::endl;
}

void CallStateMachine::handleTtsEvent(const TtsEvent& event) {
    switch (event.kind) {
        case TtsEvent::Kind::PlaybackStarted:
            if (state_.load() == CallState::Speaking) setStatusText(kSpeaking);
            break;
        case TtsEvent::Kind::QueueDrained:
            onTtsEnded();
            break;
    }
}

// ============ State entry actions ============

void CallStateMachine::enterIdle() {
    ++turn_;
    if (graceTimer_) {
        loop_.cancel(graceTimer_);
        graceTimer_ = 0;
    }

    setState(CallState::Idle);
    llmFinished_ = false;

    detachVad();
    services_.speech->stop();
    cancelChat();

    if (services_.recorder->isRecording()) {
        try {
            services_.recorder->stopRecording();
        } catch (const std::exception& e) {
            std::cerr << "[Call] [WARN] Recorder stop failed: " << e.what() << std::endl;
        }
    }

    statusText_.clear();
    publish();
}

void CallStateMachine::enterListening() {
    setState(CallState::Listening);
    llmFinished_ = false;
    statusText_ = kListening;

    if (!vadEnabled()) {
        publish();
        enterRecording(false);
        return;
    }

    try {
        attachVad(VadMode::Direct);
    } catch (const std::exception& e) {
        std::cerr << "[Call] [ERROR] VAD start failed: " << e.what() << std::endl;
        setError(std::string("VAD start failed: ") + e.what());
        enterRecording(true);
        return;
    }

    const char* text = vadStatusText(services_.vad->status());
    statusText_ = text ? text : kListening;
    publish();
}

void CallStateMachine::enterRecording(bool fromVadFailure) {
    if (services_.speech->isPlaying()) {
        std::cout << "[Call] TTS is playing, recording skipped" << std::endl;
        return;
    }

    setState(CallState::Recording);
    detachVad();
    statusText_ = kRecording;

    try {
        services_.recorder->startRecording();
    } catch (const std::exception& e) {
        std::cerr << "[Call] [ERROR] Recorder start failed: " << e.what() << std::endl;
        setError(std::string("recorder start failed: ") + e.what());
        // Without a working VAD, Listening would come straight back here
        if (fromVadFailure || !vadEnabled()) enterIdle();
        else enterListening();
        return;
    }
    publish();
}

void CallStateMachine::enterProcessing() {
    setState(CallState::Processing);
    llmFinished_ = false;
    statusText_ = kThinking;
    publish();

    AudioBytes audio;
    try {
        audio = services_.recorder->stopRecording();
    } catch (const std::exception& e) {
        std::cerr << "[Call] [ERROR] Recorder stop failed: " << e.what() << std::endl;
        setError(std::string("recorder stop failed: ") + e.what());
        enterListening();
        return;
    }

    const uint64_t turn = ++turn_;
    Transcriber* transcriber = services_.transcriber;
    auto blob = std::make_shared<AudioBytes>(std::move(audio));

    std::cout << "[Call] Transcribing " << blob->size() << " bytes (turn " << turn << ")" << std::endl;
    worker_.post([this, turn, transcriber, blob] {
        TranscriptResult result;
        std::string error;
        try {
            result = transcriber->transcribe(*blob);
        } catch (const std::exception& e) {
            error = e.what();
        }
        loop_.post([this, turn, result, error] { onTranscript(turn, result, error); });
    });
}

void CallStateMachine::enterSpeaking() {
    setState(CallState::Speaking);
    statusText_ = kSpeaking;

    if (vadEnabled()) {
        try {
            attachVad(config_.interruptWords ? VadMode::KeywordGated : VadMode::Direct);
        } catch (const std::exception& e) {
            std::cerr << "[Call] [WARN] Barge-in unavailable, VAD start failed: " << e.what() << std::endl;
        }
    }
    publish();
}

void CallStateMachine::bargeIn() {
    ++turn_;
    std::cout << "[Call] Barge-in, stopping playback" << std::endl;

    services_.speech->stop();
    cancelChat();
    detachVad();

    // Let the speaker tail die out before the microphone opens
    graceTimer_ = loop_.postDelayed(std::chrono::milliseconds(config_.bargeInGraceMs), [this] {
        graceTimer_ = 0;
        transitioning_ = false;
        if (state_.load() != CallState::Speaking) return;
        transitioning_ = true;
        enterRecording(false);
        transitioning_ = false;
        std::cout << "[Call] -> " << toString(state_.load()) << std::endl;
    });
}

// ============ Pipeline ============

void CallStateMachine::onTranscript(uint64_t turn, const TranscriptResult& result, const std::string& error) {
    if (turn != turn_ || state_.load() != CallState::Processing) {
        std::cout << "[Call] Stale transcript dropped (turn " << turn << ")" << std::endl;
        return;
    }

    if (!error.empty()) {
        std::cerr << "[Call] [ERROR] ASR failed: " << error << std::endl;
        setError("ASR failed: " + error);
        dispatch(CallEvent::of(CallEvent::Type::AsrEmpty));
        return;
    }

    const std::string text = SentenceSegmenter::trim(result.text);
    if (!result.success || text.empty()) {
        dispatch(CallEvent::of(CallEvent::Type::AsrEmpty));
        return;
    }

    std::cout << "[Call] User said: \"" << text << "\"" << std::endl;
    dispatch(CallEvent::asrComplete(text));
}

void CallStateMachine::submitChat(const std::string& text) {
    const uint64_t turn = turn_;
    ChatService* chat = services_.chat;
    chatCancel_ = makeCancelToken();
    CancelToken cancel = chatCancel_;

    worker_.post([this, turn, chat, text, cancel] {
        SentenceSegmenter segmenter;
        ChatReply reply;
        std::string error;

        try {
            reply = chat->chat(text, [this, turn, &segmenter](const std::string& token) {
                const std::string sentence = segmenter.push(token);
                if (!sentence.empty()) loop_.post([this, turn, sentence] { onSentence(turn, sentence); });
            }, cancel);
            if (!reply.aborted) {
                const std::string rest = segmenter.finish();
                if (!rest.empty()) loop_.post([this, turn, rest] { onSentence(turn, rest); });
            }
        } catch (const std::exception& e) {
            error = e.what();
        }

        const bool aborted = reply.aborted;
        loop_.post([this, turn, error, aborted] { onChatFinished(turn, error, aborted); });
    });
}

void CallStateMachine::onSentence(uint64_t turn, const std::string& sentence) {
    if (turn != turn_ || state_.load() == CallState::Idle) return;
    if (!config_.ttsEnabled) return;

    services_.speech->speak(sentence);
    if (state_.load() == CallState::Processing) dispatch(CallEvent::of(CallEvent::Type::TtsStarted));
}

void CallStateMachine::onChatFinished(uint64_t turn, const std::string& error, bool aborted) {
    if (turn != turn_ || aborted) return;

    if (!error.empty()) {
        std::cerr << "[Call] [ERROR] Chat failed: " << error << std::endl;
        setError("chat failed: " + error);
        if (state_.load() == CallState::Processing) {
            transitioning_ = true;
            enterListening();
            transitioning_ = false;
            return;
        }
        // Whatever was already queued still plays out
    }

    if (state_.load() != CallState::Idle) dispatch(CallEvent::of(CallEvent::Type::LlmComplete));
}

// ============ Helpers ============

// Covers a request still queued on the worker as well as one streaming
void CallStateMachine::cancelChat() {
    if (chatCancel_) {
        *chatCancel_ = true;
        chatCancel_.reset();
    }
    services_.chat->abort();
}

void CallStateMachine::attachVad(VadMode mode) {
    services_.vad->start(mode);
    vadAttached_ = true;
}

void CallStateMachine::detachVad() {
    vadAttached_ = false;
    if (services_.vad) services_.vad->stop();
}

bool CallStateMachine::speechBusy() const {
    return services_.speech->isPlaying() || services_.speech->isPending();
}

void CallStateMachine::setState(CallState state) {
    state_ = state;
}

void CallStateMachine::setStatusText(const std::string& text) {
    if (statusText_ == text) return;
    statusText_ = text;
    publish();
}

void CallStateMachine::setError(const std::string& error) {
    error_ = error;
    publish();
}

void CallStateMachine::publish() {
    if (onStatus_) onStatus_(status());
}
