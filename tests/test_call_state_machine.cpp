#include "call/call_state_machine.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

namespace {

// Loop and worker are driven by hand on the test thread
class CallStateMachineTest : public ::testing::Test {
protected:
    void build(CallStateMachine::Config config = CallStateMachine::Config{}, bool withVad = true) {
        config.bargeInGraceMs = 0;
        CallStateMachine::Services services;
        services.recorder = &recorder;
        services.vad = withVad ? &vad : nullptr;
        services.speech = &speech;
        services.transcriber = &transcriber;
        services.chat = &chat;
        machine = std::make_unique<CallStateMachine>(config, services, loop, worker,
                                                     [this](const CallStatus& s) { statuses.push_back(s); });
    }

    void settle() {
        for (int i = 0; i < 10; ++i) {
            size_t n = loop.runPending();
            n += worker.runPending();
            if (n == 0) break;
        }
    }

    // Listening -> Recording -> Processing, then runs ASR and chat
    void runTurn() {
        machine->startCall();
        machine->onVoiceDetected();
        machine->onSilenceDetected();
        settle();
    }

    EventLoop loop;
    EventLoop worker;
    FakeRecorder recorder;
    FakeVad vad;
    FakeSpeech speech;
    FakeTranscriber transcriber;
    FakeChat chat;
    std::vector<CallStatus> statuses;
    std::unique_ptr<CallStateMachine> machine;
};

}  // namespace

TEST_F(CallStateMachineTest, StartCallUnlocksAudioAndListens) {
    build();
    machine->startCall();

    EXPECT_EQ(machine->state(), CallState::Listening);
    EXPECT_EQ(speech.unlocks, 1);
    ASSERT_EQ(vad.modes.size(), 1u);
    EXPECT_EQ(vad.modes[0], VadMode::Direct);
    EXPECT_EQ(machine->status().text, "listening");
}

TEST_F(CallStateMachineTest, StaysIdleWhenOutputCannotUnlock) {
    build();
    speech.failUnlock = true;
    machine->startCall();

    EXPECT_EQ(machine->state(), CallState::Idle);
    EXPECT_FALSE(machine->status().error.empty());
    EXPECT_FALSE(vad.active);
}

TEST_F(CallStateMachineTest, VoiceStartsRecordingAndDetachesVad) {
    build();
    machine->startCall();
    machine->onVoiceDetected();

    EXPECT_EQ(machine->state(), CallState::Recording);
    EXPECT_FALSE(vad.active);
    EXPECT_TRUE(recorder.recording);
}

TEST_F(CallStateMachineTest, IgnoresEventsThatDoNotApply) {
    build();
    machine->onVoiceDetected();
    machine->onSilenceDetected();
    EXPECT_EQ(machine->state(), CallState::Idle);

    machine->startCall();
    machine->onSilenceDetected();
    EXPECT_EQ(machine->state(), CallState::Listening);
}

TEST_F(CallStateMachineTest, FullTurnSpeaksReplyThenListensAgain) {
    build();
    runTurn();

    EXPECT_EQ(transcriber.calls(), 1);
    ASSERT_EQ(chat.messages().size(), 1u);
    EXPECT_EQ(chat.messages()[0], "hello");

    EXPECT_EQ(machine->state(), CallState::Speaking);
    ASSERT_EQ(speech.spoken.size(), 2u);
    EXPECT_EQ(speech.spoken[0], "Hello there.");
    EXPECT_EQ(speech.spoken[1], "How are you?");
    EXPECT_TRUE(machine->llmFinished());
    EXPECT_TRUE(vad.active);

    speech.pending = false;
    machine->handleTtsEvent(TtsEvent{TtsEvent::Kind::QueueDrained, {}});
    EXPECT_EQ(machine->state(), CallState::Listening);
}

TEST_F(CallStateMachineTest, PlaybackDrainedBeforeChatClosesWaitsForLlmComplete) {
    build();
    chat.blockUntilAbort = true;
    machine->startCall();
    machine->onVoiceDetected();
    machine->onSilenceDetected();
    loop.runPending();
    worker.runPending();    // transcribe
    loop.runPending();      // AsrComplete, chat submitted

    worker.start();
    ASSERT_TRUE(loop.runUntil([this] { return speech.spoken.size() == 2; },
                              std::chrono::milliseconds(2000)));
    ASSERT_EQ(machine->state(), CallState::Speaking);

    // Queue drains while the stream is still open
    speech.pending = false;
    machine->onTtsEnded();
    EXPECT_EQ(machine->state(), CallState::Speaking);
    EXPECT_FALSE(machine->llmFinished());

    machine->dispatch(CallEvent::of(CallEvent::Type::LlmComplete));
    EXPECT_EQ(machine->state(), CallState::Listening);

    chat.abort();
    worker.stop();
}

TEST_F(CallStateMachineTest, KeywordGatedVadWhileSpeakingWhenInterruptWordsEnabled) {
    CallStateMachine::Config config;
    config.interruptWords = true;
    build(config);
    runTurn();

    ASSERT_EQ(machine->state(), CallState::Speaking);
    EXPECT_EQ(vad.mode, VadMode::KeywordGated);
}

TEST_F(CallStateMachineTest, EmptyTranscriptReturnsToListening) {
    build();
    transcriber.setText("   ");
    runTurn();

    EXPECT_EQ(machine->state(), CallState::Listening);
    EXPECT_TRUE(chat.messages().empty());
}

TEST_F(CallStateMachineTest, AsrFailureReturnsToListeningWithError) {
    build();
    transcriber.setFail(true);
    runTurn();

    EXPECT_EQ(machine->state(), CallState::Listening);
    EXPECT_NE(machine->status().error.find("ASR"), std::string::npos);
}

TEST_F(CallStateMachineTest, ChatFailureBeforeAnyTextReturnsToListening) {
    build();
    chat.tokens.clear();
    chat.error = "backend down";
    runTurn();

    EXPECT_EQ(machine->state(), CallState::Listening);
    EXPECT_TRUE(speech.spoken.empty());
}

TEST_F(CallStateMachineTest, TtsDisabledFinishesTurnWithoutSpeaking) {
    CallStateMachine::Config config;
    config.ttsEnabled = false;
    build(config);
    runTurn();

    EXPECT_TRUE(speech.spoken.empty());
    EXPECT_EQ(machine->state(), CallState::Listening);
}

TEST_F(CallStateMachineTest, BargeInStopsPlaybackAndRecordsAfterGrace) {
    build();
    chat.blockUntilAbort = true;
    machine->startCall();
    machine->onVoiceDetected();
    machine->onSilenceDetected();
    loop.runPending();
    worker.runPending();
    loop.runPending();

    // Stream the reply on a real thread so the chat stays in flight
    worker.start();
    ASSERT_TRUE(loop.runUntil([this] { return machine->state() == CallState::Speaking; },
                              std::chrono::milliseconds(2000)));

    const int stopsBefore = speech.stops;
    machine->handleVadEvent(VadEvent{VadEvent::Kind::SpeechStart, VadStatus::Active, {}});

    EXPECT_EQ(speech.stops, stopsBefore + 1);
    EXPECT_GE(chat.aborts.load(), 1);
    EXPECT_TRUE(machine->transitioning());

    ASSERT_TRUE(loop.runUntil([this] { return machine->state() == CallState::Recording; },
                              std::chrono::milliseconds(1000)));
    EXPECT_FALSE(machine->transitioning());
    EXPECT_TRUE(recorder.recording);

    worker.stop();
    loop.runPending();
    EXPECT_EQ(machine->state(), CallState::Recording);
}

TEST_F(CallStateMachineTest, EventsDuringBargeInGraceAreDropped) {
    build();
    runTurn();
    ASSERT_EQ(machine->state(), CallState::Speaking);

    machine->interrupt();
    ASSERT_TRUE(machine->transitioning());
    machine->onTtsEnded();
    machine->interrupt();
    EXPECT_EQ(machine->state(), CallState::Speaking);

    ASSERT_TRUE(loop.runUntil([this] { return machine->state() == CallState::Recording; },
                              std::chrono::milliseconds(1000)));
}

TEST_F(CallStateMachineTest, EndCallDuringGraceWins) {
    build();
    runTurn();
    machine->interrupt();
    machine->endCall();

    EXPECT_EQ(machine->state(), CallState::Idle);
    loop.runUntil([] { return false; }, std::chrono::milliseconds(20));
    EXPECT_EQ(machine->state(), CallState::Idle);
    EXPECT_FALSE(recorder.recording);
}

TEST_F(CallStateMachineTest, EndCallReleasesEverything) {
    build();
    machine->startCall();
    machine->onVoiceDetected();
    machine->endCall();

    EXPECT_EQ(machine->state(), CallState::Idle);
    EXPECT_FALSE(recorder.recording);
    EXPECT_FALSE(vad.active);
    EXPECT_GE(chat.aborts.load(), 1);
    EXPECT_TRUE(machine->status().text.empty());
}

TEST_F(CallStateMachineTest, EndCallBeforeChatStartsCancelsTheRequest) {
    build();
    machine->startCall();
    machine->onVoiceDetected();
    machine->onSilenceDetected();
    loop.runPending();
    worker.runPending();    // transcribe
    loop.runPending();      // AsrComplete, chat queued on the worker

    machine->endCall();
    settle();

    EXPECT_EQ(chat.skipped.load(), 1);
    EXPECT_TRUE(chat.messages().empty());
    EXPECT_TRUE(speech.spoken.empty());
    EXPECT_EQ(machine->state(), CallState::Idle);
}

TEST_F(CallStateMachineTest, NextTurnAfterBargeInSendsAFreshRequest) {
    build();
    runTurn();
    ASSERT_EQ(machine->state(), CallState::Speaking);
    machine->interrupt();
    loop.runUntil([this] { return machine->state() == CallState::Recording; },
                  std::chrono::milliseconds(1000));
    ASSERT_EQ(machine->state(), CallState::Recording);

    machine->onSilenceDetected();
    settle();
    EXPECT_EQ(chat.skipped.load(), 0);
    EXPECT_EQ(chat.messages().size(), 2u);
}

TEST_F(CallStateMachineTest, StaleTranscriptAfterEndCallIsDropped) {
    build();
    machine->startCall();
    machine->onVoiceDetected();
    machine->onSilenceDetected();
    machine->endCall();
    settle();

    EXPECT_EQ(machine->state(), CallState::Idle);
    EXPECT_TRUE(chat.messages().empty());
}

TEST_F(CallStateMachineTest, WithoutVadListeningRecordsDirectly) {
    build(CallStateMachine::Config{}, false);
    machine->startCall();

    EXPECT_EQ(machine->state(), CallState::Recording);
    EXPECT_TRUE(recorder.recording);
}

TEST_F(CallStateMachineTest, VadFailureFallsBackToRecording) {
    build();
    vad.failStart = true;
    machine->startCall();

    EXPECT_EQ(machine->state(), CallState::Recording);
    EXPECT_FALSE(machine->status().error.empty());
}

TEST_F(CallStateMachineTest, RecorderFailureAfterVadFailureEndsCall) {
    build();
    vad.failStart = true;
    recorder.failStart = true;
    machine->startCall();

    EXPECT_EQ(machine->state(), CallState::Idle);
}

TEST_F(CallStateMachineTest, RecorderFailureWithWorkingVadListensAgain) {
    build();
    machine->startCall();
    recorder.failStart = true;
    machine->onVoiceDetected();

    EXPECT_EQ(machine->state(), CallState::Listening);
    EXPECT_TRUE(vad.active);
}

TEST_F(CallStateMachineTest, VadDroppingWhileListeningStartsRecording) {
    build();
    machine->startCall();

    vad.currentStatus = VadStatus::Stopped;
    machine->handleVadEvent(VadEvent{VadEvent::Kind::StatusChanged, VadStatus::Stopped, {}});

    EXPECT_EQ(machine->state(), CallState::Recording);
}

TEST_F(CallStateMachineTest, VadStatusShowsInStatusText) {
    build();
    machine->startCall();

    vad.currentStatus = VadStatus::Connecting;
    machine->handleVadEvent(VadEvent{VadEvent::Kind::StatusChanged, VadStatus::Connecting, {}});
    EXPECT_EQ(machine->status().text, "connecting VAD");

    vad.currentStatus = VadStatus::Active;
    machine->handleVadEvent(VadEvent{VadEvent::Kind::StatusChanged, VadStatus::Active, {}});
    EXPECT_EQ(machine->status().text, "listening");
}

TEST_F(CallStateMachineTest, SilenceFromRecorderChannelEndsRecording) {
    build();
    machine->startCall();
    machine->onVoiceDetected();
    machine->handleRecorderEvent(RecorderEvent{RecorderEvent::Kind::SilenceDetected, {}});

    EXPECT_EQ(machine->state(), CallState::Processing);
    EXPECT_EQ(recorder.stops, 1);
    EXPECT_EQ(machine->status().text, "thinking");
}

TEST_F(CallStateMachineTest, LostMicrophoneWhileRecordingListensAgain) {
    build();
    machine->startCall();
    machine->onVoiceDetected();
    ASSERT_EQ(machine->state(), CallState::Recording);

    machine->handleRecorderEvent(RecorderEvent{RecorderEvent::Kind::InputFailed, "device unplugged"});
    EXPECT_EQ(machine->state(), CallState::Listening);
    EXPECT_FALSE(recorder.recording);
    EXPECT_TRUE(vad.active);
    EXPECT_NE(machine->status().error.find("device unplugged"), std::string::npos);
    EXPECT_EQ(transcriber.calls(), 0);
}

TEST_F(CallStateMachineTest, LostMicrophoneWithoutVadEndsCall) {
    build(CallStateMachine::Config{}, false);
    machine->startCall();
    ASSERT_EQ(machine->state(), CallState::Recording);

    machine->handleRecorderEvent(RecorderEvent{RecorderEvent::Kind::InputFailed, "device unplugged"});
    EXPECT_EQ(machine->state(), CallState::Idle);
    EXPECT_FALSE(recorder.recording);
}

TEST_F(CallStateMachineTest, PublishesStatusOnEveryStateChange) {
    build();
    runTurn();

    ASSERT_FALSE(statuses.empty());
    EXPECT_EQ(statuses.front().state, CallState::Listening);
    EXPECT_EQ(statuses.back().state, CallState::Speaking);
}
