#ifndef AUDIO_RECORDER_HPP
#define AUDIO_RECORDER_HPP

#include "audio/audio_device.hpp"
#include "audio/silence_detector.hpp"
#include "audio/spectrum_analyzer.hpp"
#include "call/call_services.hpp"
#include "core/event_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Captures one user turn. Every capture buffer is one analysis frame: the
// AudioLevel is recomputed and fed to the silence detector, which reports
// SilenceDetected once per recording. The length cap runs on its own timer so
// it still fires when the stream stops delivering frames; a dead stream is
// reported as InputFailed.
class AudioRecorder : public RecorderService {
public:
    struct Config {
        int silenceThreshold = 30;     // AudioLevel 0-255
        int silenceDurationMs = 1500;
        int maxRecordingMs = 60000;    // reported as silence when reached
        int fftSize = 256;
    };

    AudioRecorder(Config config, AudioInputFactory inputFactory, EventSink<RecorderEvent>* sink);
    ~AudioRecorder() override;

    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    void startRecording() override;
    AudioBytes stopRecording() override;
    bool isRecording() const override { return recording_.load(); }

    int level() const { return level_.load(); }
    float normalizedLevel() const { return level_.load() / 255.0f; }

    void setConfig(Config config);

    // Capture-thread entry; also driven directly by tests
    void onFrames(const int16_t* samples, int frames, std::chrono::steady_clock::time_point now);

private:
    void cleanup();
    void watch(std::chrono::steady_clock::time_point deadline);
    void onInputError(const std::string& error);
    void finishWatch();

    Config config_;
    AudioInputFactory inputFactory_;
    EventSink<RecorderEvent>* sink_;

    std::unique_ptr<AudioInput> input_;
    int sampleRate_ = 16000;

    std::mutex mutex_;
    SpectrumAnalyzer analyzer_;
    SilenceDetector silence_;
    std::vector<int16_t> samples_;
    std::chrono::steady_clock::time_point startedAt_{};
    std::chrono::steady_clock::time_point lastLog_{};
    bool reported_ = false;

    std::thread watchdog_;
    std::condition_variable watchCv_;

    std::atomic<bool> recording_{false};
    std::atomic<int> level_{0};
};

#endif
