#include "audio/pcm_ring_buffer.hpp"
#include "audio/silence_detector.hpp"
#include "audio/spectrum_analyzer.hpp"
#include "audio/wav.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

// ============ Silence detector ============

TEST(SilenceDetectorTest, NeverFiresBeforeSpeech) {
    SilenceDetector detector(SilenceDetector::Config{30, 100});
    const auto t0 = Clock::now();
    for (int i = 0; i < 100; ++i) EXPECT_FALSE(detector.feed(5, t0 + milliseconds(i * 50)));
    EXPECT_FALSE(detector.hasSpoken());
}

TEST(SilenceDetectorTest, FiresOnceAfterSustainedSilence) {
    SilenceDetector detector(SilenceDetector::Config{30, 100});
    const auto t0 = Clock::now();
    EXPECT_FALSE(detector.feed(80, t0));
    EXPECT_FALSE(detector.feed(10, t0 + milliseconds(10)));
    EXPECT_FALSE(detector.feed(10, t0 + milliseconds(100)));
    EXPECT_TRUE(detector.feed(10, t0 + milliseconds(120)));
    EXPECT_FALSE(detector.feed(10, t0 + milliseconds(500)));
    EXPECT_TRUE(detector.fired());
}

TEST(SilenceDetectorTest, LoudFrameRestartsTheTimer) {
    SilenceDetector detector(SilenceDetector::Config{30, 100});
    const auto t0 = Clock::now();
    detector.feed(80, t0);
    detector.feed(10, t0 + milliseconds(10));
    detector.feed(80, t0 + milliseconds(90));
    EXPECT_EQ(detector.silenceMs(t0 + milliseconds(95)), 0);
    EXPECT_FALSE(detector.feed(10, t0 + milliseconds(150)));
    EXPECT_FALSE(detector.feed(10, t0 + milliseconds(200)));
    EXPECT_TRUE(detector.feed(10, t0 + milliseconds(260)));
}

TEST(SilenceDetectorTest, LevelAtThresholdCountsAsSilence) {
    SilenceDetector detector(SilenceDetector::Config{30, 50});
    const auto t0 = Clock::now();
    detector.feed(31, t0);
    detector.feed(30, t0 + milliseconds(1));
    EXPECT_TRUE(detector.feed(30, t0 + milliseconds(60)));
}

// ============ Spectrum analyzer ============

TEST(SpectrumAnalyzerTest, SilenceHasZeroLevel) {
    SpectrumAnalyzer analyzer(SpectrumAnalyzer::Config{});
    const auto quiet = silence(256);
    analyzer.push(quiet.data(), (int)quiet.size());
    analyzer.analyze();
    EXPECT_EQ(analyzer.level(), 0);
    EXPECT_EQ(analyzer.bytes().size(), 128u);
}

TEST(SpectrumAnalyzerTest, LoudNoiseRaisesLevel) {
    SpectrumAnalyzer::Config config;
    config.smoothing = 0.0f;
    SpectrumAnalyzer analyzer(config);
    const auto loud = noise(256);
    analyzer.push(loud.data(), (int)loud.size());
    analyzer.analyze();
    EXPECT_GT(analyzer.level(), 100);
}

TEST(SpectrumAnalyzerTest, ToneLandsInItsBin) {
    SpectrumAnalyzer::Config config;
    config.fftSize = 1024;
    config.smoothing = 0.0f;
    SpectrumAnalyzer analyzer(config);

    std::vector<float> tone(1024);
    const double hz = 1000.0;
    for (size_t i = 0; i < tone.size(); ++i) tone[i] = 0.5f * (float)std::sin(2.0 * 3.14159265358979 * hz * i / 16000.0);
    analyzer.push(tone.data(), (int)tone.size());
    const auto& bins = analyzer.analyze();

    const int expected = (int)std::lround(hz / analyzer.binHz(16000));
    const auto peak = std::max_element(bins.begin(), bins.end()) - bins.begin();
    EXPECT_NEAR((double)peak, (double)expected, 1.0);
}

TEST(SpectrumAnalyzerTest, RejectsNonPowerOfTwo) {
    SpectrumAnalyzer::Config config;
    config.fftSize = 300;
    EXPECT_THROW(SpectrumAnalyzer analyzer(config), std::invalid_argument);
}

// ============ Ring buffer ============

TEST(PcmRingBufferTest, KeepsOnlyTheMostRecentSamples) {
    PcmRingBuffer ring(1000, 10);    // 10 samples
    std::vector<int16_t> data(25);
    for (size_t i = 0; i < data.size(); ++i) data[i] = (int16_t)i;
    ring.push(data.data(), data.size());

    const auto snap = ring.snapshot();
    ASSERT_EQ(snap.size(), 10u);
    EXPECT_EQ(snap.front(), 15);
    EXPECT_EQ(snap.back(), 24);

    ring.clear();
    EXPECT_EQ(ring.size(), 0u);
}

// ============ WAV ============

TEST(WavTest, EncodesCanonicalHeader) {
    const AudioBytes wav = encodeWav(std::vector<int16_t>(100, 0), 16000, 1);
    ASSERT_EQ(wav.size(), 44u + 200u);
    EXPECT_EQ(std::string(wav.begin(), wav.begin() + 4), "RIFF");
    EXPECT_EQ(std::string(wav.begin() + 8, wav.begin() + 12), "WAVE");
}

TEST(WavTest, DecodesPcm16ToFloat) {
    const AudioBytes wav = encodeWav(std::vector<int16_t>{16384, -16384, 0, 32767}, 22050, 2);
    const PcmAudio pcm = decodeWav(wav);
    EXPECT_EQ(pcm.sampleRate, 22050);
    EXPECT_EQ(pcm.channels, 2);
    ASSERT_EQ(pcm.samples.size(), 4u);
    EXPECT_NEAR(pcm.samples[0], 0.5f, 1e-4);
    EXPECT_NEAR(pcm.samples[1], -0.5f, 1e-4);
}

TEST(WavTest, RejectsGarbage) {
    EXPECT_THROW(decodeWav(AudioBytes{'n', 'o', 'p', 'e'}), std::runtime_error);
    AudioBytes notWave = shortWav();
    notWave[8] = 'X';
    EXPECT_THROW(decodeWav(notWave), std::runtime_error);
}

TEST(WavTest, FloatToPcm16Clips) {
    const float in[] = {2.0f, -2.0f, 0.0f};
    const auto out = floatToPcm16(in, 3);
    EXPECT_EQ(out[0], 32767);
    EXPECT_LE(out[1], -32767);
    EXPECT_EQ(out[2], 0);
}
