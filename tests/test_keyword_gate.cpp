#include "vad/keyword_gate.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

TEST(KeywordGateTest, WordListPutsNameFirstAndDropsDuplicates) {
    const auto words = KeywordGate::buildWordList("Nova", {"nova", "Nova", ""}, {"stop", "wait", "stop"});
    const std::vector<std::string> expected = {"Nova", "nova", "stop", "wait"};
    EXPECT_EQ(words, expected);
}

TEST(KeywordGateTest, MatchIsCaseInsensitiveSubstring) {
    EventLoop worker;
    KeywordGate gate(KeywordGate::Config{{"Stop", "\xE5\xB0\x8F\xE6\x99\xBA"}, 300, 3000},
                     std::make_shared<FakeTranscriber>(), worker);

    EXPECT_EQ(gate.match("please STOP now"), "Stop");
    EXPECT_EQ(gate.match("\xE4\xBD\xA0\xE5\xA5\xBD\xE5\xB0\x8F\xE6\x99\xBA"), "\xE5\xB0\x8F\xE6\x99\xBA");
    EXPECT_EQ(gate.match("carry on"), "");
    EXPECT_EQ(gate.match(""), "");
}

TEST(KeywordGateTest, DisabledWithoutWordsOrTranscriber) {
    EventLoop worker;
    KeywordGate noWords(KeywordGate::Config{}, std::make_shared<FakeTranscriber>(), worker);
    EXPECT_FALSE(noWords.enabled());

    KeywordGate noAsr(KeywordGate::Config{{"stop"}, 300, 3000}, nullptr, worker);
    EXPECT_FALSE(noAsr.enabled());

    noWords.setWords({"wait"});
    EXPECT_TRUE(noWords.enabled());
}

TEST(KeywordGateTest, VerifyTranscribesOnTheWorker) {
    EventLoop worker;
    auto transcriber = std::make_shared<FakeTranscriber>("ok wait a second");
    KeywordGate gate(KeywordGate::Config{{"stop", "wait"}, 300, 3000}, transcriber, worker);

    std::string keyword = "unset";
    std::string transcript;
    gate.verify(std::vector<int16_t>(1600, 100), [&](const std::string& k, const std::string& t) {
        keyword = k;
        transcript = t;
    });
    EXPECT_EQ(transcriber->calls(), 0);

    worker.runPending();
    EXPECT_EQ(keyword, "wait");
    EXPECT_EQ(transcript, "ok wait a second");
    EXPECT_EQ(transcriber->lastSize(), 44u + 3200u);
}
