#include "call/voice_call_session.hpp"

#include "asr/http_transcriber.hpp"
#include "asr/whisper_transcriber.hpp"
#include "chat/sse_chat_client.hpp"
#include "tts/http_synthesizer.hpp"

#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

// Constructor
VoiceCallSession::VoiceCallSession(Settings settings, Components components)
    : settings_(std::move(settings)), components_(std::move(components)) {}

// Destructor
VoiceCallSession::~VoiceCallSession() { dispose(); }

VoiceCallSession::Components VoiceCallSession::defaultComponents(const Settings& settings) {
    Components c;

    const AudioInput::Config inputConfig = settings.audio.input;
    c.inputFactory = [inputConfig] { return makePortAudioInput(inputConfig); };

    const AudioOutput::Config outputConfig = settings.audio.output;
    c.outputFactory = [outputConfig] { return makePortAudioOutput(outputConfig); };

    c.socketFactory = [] { return makeLwsWebSocket(); };

    if (settings.asr.backend == "whisper") {
        c.transcriber = std::make_shared<WhisperTranscriber>(settings.asr.whisper);
    } else {
        c.transcriber = std::make_shared<HttpTranscriber>(settings.asr.http);
    }
    c.synthesizer = std::make_shared<HttpSynthesizer>(settings.tts.http);
    c.chat = std::make_shared<SseChatClient>(settings.llm);
    return c;
}

void VoiceCallSession::init() {
    if (initialized_) return;
    if (!components_.inputFactory || !components_.outputFactory || !components_.transcriber ||
        !components_.synthesizer || !components_.chat) {
        throw std::runtime_error("VoiceCallSession: missing component");
    }

    vadSink_ = std::make_unique<LoopSink<VadEvent>>(loop_, [this](const VadEvent& e) {
        if (machine_) machine_->handleVadEvent(e);
    });
    recorderSink_ = std::make_unique<LoopSink<RecorderEvent>>(loop_, [this](const RecorderEvent& e) {
        if (machine_) machine_->handleRecorderEvent(e);
    });
    ttsSink_ = std::make_unique<LoopSink<TtsEvent>>(loop_, [this](const TtsEvent& e) {
        if (machine_) machine_->handleTtsEvent(e);
    });

    KeywordGate::Config gateConfig;
    if (settings_.assistant.interruptWords) gateConfig.words = settings_.interruptWords();
    gate_ = std::make_unique<KeywordGate>(gateConfig, components_.transcriber, gateWorker_);

    if (settings_.vad.enabled) {
        vad_ = std::make_unique<VadController>(makeVadBackend(settings_.vad, components_.inputFactory,
                                                              components_.socketFactory, vadSink_.get(),
                                                              gate_.get()));
        std::cout << "[Session] VAD backend: " << toString(settings_.vad.type) << std::endl;
    } else {
        std::cout << "[Session] VAD disabled, recording directly" << std::endl;
    }

    recorder_ = std::make_unique<AudioRecorder>(settings_.recorder, components_.inputFactory, recorderSink_.get());
    player_ = std::make_unique<StreamingTtsPlayer>(settings_.tts.player, components_.synthesizer,
                                                   components_.outputFactory(), ttsSink_.get());

    CallStateMachine::Config callConfig = settings_.call;
    callConfig.ttsEnabled = settings_.tts.enabled;
    callConfig.interruptWords = gate_->enabled();

    CallStateMachine::Services services;
    services.recorder = recorder_.get();
    services.vad = vad_.get();
    services.speech = player_.get();
    services.transcriber = components_.transcriber.get();
    services.chat = components_.chat.get();

    machine_ = std::make_unique<CallStateMachine>(callConfig, services, loop_, worker_,
                                                  [this](const CallStatus& s) { onStatus(s); });

    worker_.start();
    gateWorker_.start();
    loop_.start();
    initialized_ = true;
}

void VoiceCallSession::dispose() {
    if (!initialized_) return;
    initialized_ = false;

    // End the call on the loop so the state machine releases every service
    if (loop_.isRunning()) {
        std::promise<void> done;
        std::future<void> ended = done.get_future();
        loop_.post([this, &done] {
            machine_->endCall();
            done.set_value();
        });
        ended.wait();
    }

    if (vad_) vad_->stop();
    if (player_) player_->stop();
    components_.chat->abort();

    loop_.stop();
    worker_.stop();
    gateWorker_.stop();

    machine_.reset();
    player_.reset();
    recorder_.reset();
    vad_.reset();
    gate_.reset();
}

void VoiceCallSession::startCall() {
    loop_.post([this] { if (machine_) machine_->startCall(); });
}

void VoiceCallSession::endCall() {
    loop_.post([this] { if (machine_) machine_->endCall(); });
}

void VoiceCallSession::interrupt() {
    loop_.post([this] { if (machine_) machine_->interrupt(); });
}

// Switching is stop-then-start; a running backend restarts in its mode
void VoiceCallSession::setVadType(VadType type) {
    loop_.post([this, type] {
        if (!vad_) {
            std::cerr << "[Session] [WARN] VAD is disabled, ignoring switch to " << toString(type) << std::endl;
            return;
        }
        settings_.vad.type = type;
        try {
            vad_->setBackend(makeVadBackend(settings_.vad, components_.inputFactory,
                                            components_.socketFactory, vadSink_.get(), gate_.get()));
            std::cout << "[Session] VAD backend: " << toString(type) << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Session] [ERROR] VAD switch failed: " << e.what() << std::endl;
        }
    });
}

void VoiceCallSession::setGain(float gain) {
    if (player_) player_->setGain(gain);
}

void VoiceCallSession::setStatusListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    listener_ = std::move(listener);
}

CallStatus VoiceCallSession::status() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

void VoiceCallSession::onStatus(const CallStatus& status) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_ = status;
        listener = listener_;
    }
    if (listener) listener(status);
}
