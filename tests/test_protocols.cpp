#include "asr/http_transcriber.hpp"
#include "chat/sse_chat_client.hpp"
#include "control/control_channel.hpp"
#include "net/sse_parser.hpp"
#include "net/websocket_client.hpp"
#include "tts/http_synthesizer.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ============ SSE ============

TEST(SseParserTest, ReturnsDataPayloadsAcrossChunks) {
    SseParser parser;
    auto out = parser.feed(std::string("data: {\"type\":\"tok"));
    EXPECT_TRUE(out.empty());

    out = parser.feed(std::string("en\"}\r\n\r\ndata: second\n: comment\nevent: x\n"));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "{\"type\":\"token\"}");
    EXPECT_EQ(out[1], "second");
}

TEST(SseParserTest, FinishFlushesTrailingLine) {
    SseParser parser;
    parser.feed(std::string("data: tail"));
    const auto out = parser.finish();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "tail");
    EXPECT_TRUE(parser.finish().empty());
}

// ============ Chat ============

TEST(ChatFrameTest, ParsesEachFrameType) {
    ChatFrame frame;
    ASSERT_TRUE(SseChatClient::parseFrame(R"({"type":"token","content":"Hi"})", frame));
    EXPECT_EQ(frame.type, ChatFrame::Type::Token);
    EXPECT_EQ(frame.content, "Hi");

    ASSERT_TRUE(SseChatClient::parseFrame(R"({"type":"skill_start","name":"weather","input":{"city":"Oslo"}})", frame));
    EXPECT_EQ(frame.type, ChatFrame::Type::SkillStart);
    EXPECT_EQ(frame.name, "weather");
    EXPECT_EQ(json::parse(frame.input)["city"], "Oslo");

    ASSERT_TRUE(SseChatClient::parseFrame(R"({"type":"error","message":"quota"})", frame));
    EXPECT_EQ(frame.type, ChatFrame::Type::Error);
    EXPECT_EQ(frame.message, "quota");

    ASSERT_TRUE(SseChatClient::parseFrame(R"({"type":"music","action":"play"})", frame));
    EXPECT_EQ(frame.type, ChatFrame::Type::Music);

    ASSERT_TRUE(SseChatClient::parseFrame(R"({"type":"done"})", frame));
    EXPECT_EQ(frame.type, ChatFrame::Type::Done);

    ASSERT_TRUE(SseChatClient::parseFrame(R"({"type":"mystery"})", frame));
    EXPECT_EQ(frame.type, ChatFrame::Type::Unknown);
}

TEST(ChatFrameTest, RejectsNonObjects) {
    ChatFrame frame;
    EXPECT_FALSE(SseChatClient::parseFrame("[DONE]", frame));
    EXPECT_FALSE(SseChatClient::parseFrame("\"text\"", frame));
}

TEST(ChatRequestTest, BodyCarriesMessageAndSettings) {
    SseChatClient::Config config;
    config.model = "qwen";
    SseChatClient client(config);

    const json body = json::parse(client.requestBody("hello"));
    EXPECT_EQ(body["message"], "hello");
    EXPECT_TRUE(body["history"].is_array());
    EXPECT_EQ(body["model"], "qwen");
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.7);
    EXPECT_EQ(body["max_tokens"], 1500);

    SseChatClient noModel(SseChatClient::Config{});
    EXPECT_FALSE(json::parse(noModel.requestBody("x")).contains("model"));
}

// ============ TTS ============

TEST(ChatRequestTest, CancelledRequestIsNeverSent) {
    SseChatClient::Config config;
    config.url = "http://127.0.0.1:9/api/chat";
    SseChatClient client(config);
    client.abort();

    CancelToken cancel = makeCancelToken();
    *cancel = true;
    const ChatReply reply = client.chat("hello", nullptr, cancel);

    EXPECT_TRUE(reply.aborted);
    EXPECT_TRUE(reply.text.empty());
    EXPECT_TRUE(client.history().empty());
    EXPECT_FALSE(client.busy());
}

TEST(SynthesisRequestTest, BodyClampsSpeedAndAddsCustomVoice) {
    SynthesisRequest request;
    request.text = "hi";
    request.speed = 5.0;

    json body = json::parse(HttpSynthesizer::requestBody(request));
    EXPECT_EQ(body["text"], "hi");
    EXPECT_EQ(body["voice"], "alex");
    EXPECT_DOUBLE_EQ(body["speed"].get<double>(), 2.0);
    EXPECT_EQ(body["response_format"], "wav");
    EXPECT_FALSE(body.contains("custom_voice_id"));

    request.customVoiceId = "v-42";
    request.speed = 0.1;
    body = json::parse(HttpSynthesizer::requestBody(request));
    EXPECT_EQ(body["custom_voice_id"], "v-42");
    EXPECT_DOUBLE_EQ(body["speed"].get<double>(), 0.5);
}

// ============ ASR ============

TEST(TranscriptParseTest, ReadsTextAndSegments) {
    const TranscriptResult r = HttpTranscriber::parseResult(
        R"({"success":true,"text":"hello world","segments":[{"start":0.0,"end":1.2,"text":"hello world"}]})");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.text, "hello world");
    ASSERT_EQ(r.segments.size(), 1u);
    EXPECT_DOUBLE_EQ(r.segments[0].end, 1.2);
}

TEST(TranscriptParseTest, MissingFieldsMeanNoSpeech) {
    const TranscriptResult r = HttpTranscriber::parseResult("{}");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.text.empty());
    EXPECT_THROW(HttpTranscriber::parseResult("<html>"), std::runtime_error);
}

// ============ WebSocket url ============

TEST(WebSocketUrlTest, ParsesHostPortAndPath) {
    const WebSocketUrl a = parseWebSocketUrl("ws://127.0.0.1:6002/ws/vad");
    EXPECT_FALSE(a.secure);
    EXPECT_EQ(a.host, "127.0.0.1");
    EXPECT_EQ(a.port, 6002);
    EXPECT_EQ(a.path, "/ws/vad");

    const WebSocketUrl b = parseWebSocketUrl("wss://example.org");
    EXPECT_TRUE(b.secure);
    EXPECT_EQ(b.port, 443);
    EXPECT_EQ(b.path, "/");
}

TEST(WebSocketUrlTest, RejectsOtherSchemes) {
    EXPECT_THROW(parseWebSocketUrl("http://example.org"), std::invalid_argument);
    EXPECT_THROW(parseWebSocketUrl("ws://:80/"), std::invalid_argument);
    EXPECT_THROW(parseWebSocketUrl("ws://host:port/"), std::invalid_argument);
}

// ============ Control ============

TEST(ControlMessageTest, ParsesCommands) {
    EXPECT_EQ(ControlChannel::parse(R"({"type":"start_call"})").type, ControlMessage::Type::StartCall);
    EXPECT_EQ(ControlChannel::parse(R"({"type":"end_call"})").type, ControlMessage::Type::EndCall);
    EXPECT_EQ(ControlChannel::parse(R"({"type":"interrupt"})").type, ControlMessage::Type::Interrupt);
    EXPECT_EQ(ControlChannel::parse(R"({"type":"status"})").type, ControlMessage::Type::Status);

    const ControlMessage vad = ControlChannel::parse(R"({"type":"set_vad","vad_type":"funasr"})");
    EXPECT_EQ(vad.type, ControlMessage::Type::SetVad);
    EXPECT_EQ(vad.vadType, "funasr");

    const ControlMessage gain = ControlChannel::parse(R"({"type":"set_gain","gain":12.5})");
    EXPECT_EQ(gain.type, ControlMessage::Type::SetGain);
    EXPECT_FLOAT_EQ(gain.gain, 12.5f);
}

TEST(ControlMessageTest, MalformedIsUnknown) {
    EXPECT_EQ(ControlChannel::parse("start").type, ControlMessage::Type::Unknown);
    EXPECT_EQ(ControlChannel::parse(R"({"type":"dance"})").type, ControlMessage::Type::Unknown);
    EXPECT_EQ(ControlChannel::parse(R"({"type":"set_vad"})").type, ControlMessage::Type::Unknown);
    EXPECT_EQ(ControlChannel::parse(R"({"type":"set_gain","gain":"loud"})").type, ControlMessage::Type::Unknown);
}

TEST(ControlMessageTest, StatusJsonCarriesStateTextAndError) {
    CallStatus status;
    status.state = CallState::Speaking;
    status.text = "speaking";
    status.error = "";
    const json j = json::parse(ControlChannel::statusJson(status));
    EXPECT_EQ(j["type"], "status");
    EXPECT_EQ(j["state"], toString(CallState::Speaking));
    EXPECT_EQ(j["text"], "speaking");
    EXPECT_EQ(j["error"], "");
}
