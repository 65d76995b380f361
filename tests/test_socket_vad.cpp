#include "vad/socket_vad.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using Clock = std::chrono::steady_clock;
using json = nlohmann::json;

namespace {

class SocketVadTest : public ::testing::Test {
protected:
    SocketVadTest() : vad(config(), base(), mic.factory(), hub.factory(), &sink, nullptr) {}

    static SocketVad::Config config() {
        SocketVad::Config c;
        c.variant = SocketVad::Variant::Server;
        c.url = "ws://127.0.0.1:10096";
        return c;
    }

    static VadBackend::Config base() {
        VadBackend::Config c;
        c.ignoreMs = 0;
        return c;
    }

    Clock::time_point later() { return Clock::now() + std::chrono::milliseconds(10); }

    FakeMic mic;
    FakeSocketHub hub;
    RecordingSink<VadEvent> sink;
    SocketVad vad;
};

}  // namespace

TEST_F(SocketVadTest, ConnectsAndSendsConfigOnOpen) {
    vad.start(VadMode::Direct);
    EXPECT_EQ(hub.url, "ws://127.0.0.1:10096");
    EXPECT_EQ(vad.status(), VadStatus::Connecting);

    hub.accept();
    EXPECT_EQ(vad.status(), VadStatus::Active);

    const auto texts = hub.sentTexts();
    ASSERT_EQ(texts.size(), 1u);
    const json config = json::parse(texts[0]);
    EXPECT_EQ(config["mode"], "online");
    EXPECT_EQ(config["chunk_size"], json({5, 10, 5}));
    EXPECT_EQ(config["is_speaking"], true);
    EXPECT_EQ(config["wav_format"], "pcm");
}

TEST_F(SocketVadTest, BackendVariantReportsLoading) {
    SocketVad::Config c = config();
    c.variant = SocketVad::Variant::Backend;
    c.url = "ws://127.0.0.1:6002/ws/vad";
    FakeSocketHub other;
    SocketVad backend(c, base(), mic.factory(), other.factory(), &sink, nullptr);

    backend.start(VadMode::Direct);
    EXPECT_EQ(backend.name(), "socket-backend");
    EXPECT_EQ(backend.status(), VadStatus::Loading);
    backend.stop();
}

TEST_F(SocketVadTest, AudioIsStreamedOnlyOnceActive) {
    vad.start(VadMode::Direct);
    const auto frame = noise(320);

    vad.onFrames(frame.data(), (int)frame.size(), later());
    EXPECT_EQ(hub.sentBinary(), 0u);

    hub.accept();
    vad.onFrames(frame.data(), (int)frame.size(), later());
    EXPECT_EQ(hub.sentBinary(), 640u);
}

TEST_F(SocketVadTest, TextRepliesDriveSpeechEvents) {
    vad.start(VadMode::Direct);
    hub.accept();

    vad.handleMessage(R"({"text":"hel","is_final":false})", later());
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechStart), 1u);
    vad.handleMessage(R"({"text":"hello","is_final":false})", later());
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechStart), 1u);

    vad.handleMessage(R"({"text":"","is_final":false})", later());
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechEnd), 1u);
}

TEST_F(SocketVadTest, FinalReplyEndsSpeech) {
    vad.start(VadMode::Direct);
    hub.accept();

    vad.handleMessage(R"({"text":"hello there","is_final":true})", later());
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechStart), 1u);
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechEnd), 1u);
    EXPECT_FALSE(vad.isSpeaking());
}

TEST_F(SocketVadTest, MalformedRepliesAreDropped) {
    vad.start(VadMode::Direct);
    hub.accept();

    vad.handleMessage("not json", later());
    vad.handleMessage("[1,2,3]", later());
    vad.handleMessage(R"({"text":42})", later());
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechStart), 0u);
    EXPECT_TRUE(vad.isActive());
}

TEST_F(SocketVadTest, RepliesInsideIgnoreWindowAreSkipped) {
    VadBackend::Config slow;
    slow.ignoreMs = 800;
    FakeSocketHub other;
    SocketVad gated(config(), slow, mic.factory(), other.factory(), &sink, nullptr);
    gated.start(VadMode::Direct);
    other.accept();

    gated.handleMessage(R"({"text":"echo"})", Clock::now());
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechStart), 0u);

    gated.handleMessage(R"({"text":"real"})", Clock::now() + std::chrono::milliseconds(900));
    EXPECT_EQ(sink.count(VadEvent::Kind::SpeechStart), 1u);
    gated.stop();
}

TEST_F(SocketVadTest, StopSendsEndFrameAndCloses) {
    vad.start(VadMode::Direct);
    hub.accept();
    vad.stop();

    const auto texts = hub.sentTexts();
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(json::parse(texts[1]), json({{"is_speaking", false}}));
    EXPECT_EQ(hub.closes, 1);
    EXPECT_EQ(vad.status(), VadStatus::Stopped);
}

TEST_F(SocketVadTest, RemoteCloseReportsStopped) {
    vad.start(VadMode::Direct);
    hub.accept();
    sink.clear();

    hub.drop("server went away");
    EXPECT_EQ(vad.status(), VadStatus::Stopped);
    const auto events = sink.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, VadEvent::Kind::StatusChanged);
    EXPECT_EQ(events[0].status, VadStatus::Stopped);
}

TEST_F(SocketVadTest, ConnectFailureThrowsAndStaysStopped) {
    hub.failConnect = true;
    EXPECT_THROW(vad.start(VadMode::Direct), std::runtime_error);
    EXPECT_FALSE(vad.isActive());
    EXPECT_EQ(vad.status(), VadStatus::Stopped);
    EXPECT_EQ(mic.opened, 0);
}
