#include "audio/audio_device.hpp"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

namespace {

class PortAudioInput : public AudioInput {
public:
    explicit PortAudioInput(Config config) : config_(config) {}
    ~PortAudioInput() override { stop(); }

    void start(FrameCallback callback, ErrorCallback onError) override;
    void stop() override;

    bool isRunning() const override { return running_.load(); }
    int sampleRate() const override { return config_.sampleRate; }

private:
    void run();

    Config config_;
    FrameCallback callback_;
    ErrorCallback onError_;

    PaStream* stream_ = nullptr;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

// Opens the input device and starts the reader thread
void PortAudioInput::start(FrameCallback callback, ErrorCallback onError) {
    if (running_.load()) return;
    // A reader that died leaves its stream and thread behind
    if (stream_) stop();

    pa_check(Pa_Initialize(), "Pa_Initialize");

    try {
        PaStreamParameters inParams{};
        inParams.device = config_.device >= 0 ? config_.device : Pa_GetDefaultInputDevice();
        if (inParams.device == paNoDevice) {
            throw std::runtime_error("No default input device");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
        std::cout << "[Audio] Input device: " << (info ? info->name : "(unknown)") << std::endl;

        inParams.channelCount = 1;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        inParams.hostApiSpecificStreamInfo = nullptr;

        pa_check(
            Pa_OpenStream(&stream_, &inParams, nullptr,
                          config_.sampleRate, config_.framesPerBuffer,
                          paNoFlag, nullptr, nullptr),
            "Pa_OpenStream"
        );

        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    } catch (...) {
        if (stream_) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        Pa_Terminate();
        throw;
    }

    callback_ = std::move(callback);
    onError_ = std::move(onError);
    running_ = true;
    thread_ = std::thread(&PortAudioInput::run, this);
}

// Stops the reader thread and releases the device. Also needed after the
// reader died on its own, which leaves the stream open.
void PortAudioInput::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();

    if (!stream_) return;
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    Pa_Terminate();
}

void PortAudioInput::run() {
    std::vector<int16_t> buff(config_.framesPerBuffer);

    while (running_.load()) {
        PaError e = Pa_ReadStream(stream_, buff.data(), config_.framesPerBuffer);
        if (e == paInputOverflowed) {
            continue;
        }
        if (e != paNoError) {
            const std::string error = std::string("Pa_ReadStream: ") + Pa_GetErrorText(e);
            std::cerr << "[Audio] [ERROR] " << error << std::endl;
            running_ = false;
            try {
                if (onError_) onError_(error);
            } catch (const std::exception& ex) {
                std::cerr << "[Audio] [ERROR] error callback threw: " << ex.what() << std::endl;
            }
            return;
        }

        try {
            if (callback_) callback_(buff.data(), config_.framesPerBuffer);
        } catch (const std::exception& ex) {
            std::cerr << "[Audio] [ERROR] frame callback threw: " << ex.what() << std::endl;
        }
    }
}

class PortAudioOutput : public AudioOutput {
public:
    explicit PortAudioOutput(Config config) : config_(config) {}
    ~PortAudioOutput() override { close(); }

    void open() override;
    void close() override;

    bool play(const PcmAudio& audio, float gain) override;
    void stop() override { stopRequested_ = true; }
    void resume() override { stopRequested_ = false; }

private:
    void reopenFor(int sampleRate, int channels);

    Config config_;
    std::mutex mutex_;
    bool initialized_ = false;
    PaStream* stream_ = nullptr;
    int streamRate_ = 0;
    int streamChannels_ = 0;
    std::atomic<bool> stopRequested_{false};
};

// Initializes PortAudio so the first sentence does not pay for it
void PortAudioOutput::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) return;
    pa_check(Pa_Initialize(), "Pa_Initialize");
    initialized_ = true;
    std::cout << "[Audio] Output unlocked" << std::endl;
}

void PortAudioOutput::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

// Output streams are opened per format; TTS voices rarely change format mid-call
void PortAudioOutput::reopenFor(int sampleRate, int channels) {
    if (stream_ && streamRate_ == sampleRate && streamChannels_ == channels) return;

    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

    PaStreamParameters outParams{};
    outParams.device = config_.device >= 0 ? config_.device : Pa_GetDefaultOutputDevice();
    if (outParams.device == paNoDevice) {
        throw std::runtime_error("No default output device");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(outParams.device);
    outParams.channelCount = channels;
    outParams.sampleFormat = paFloat32;
    outParams.suggestedLatency = info ? info->defaultLowOutputLatency : 0.05;
    outParams.hostApiSpecificStreamInfo = nullptr;

    pa_check(
        Pa_OpenStream(&stream_, nullptr, &outParams,
                      sampleRate, config_.framesPerBuffer,
                      paClipOff, nullptr, nullptr),
        "Pa_OpenStream"
    );
    pa_check(Pa_StartStream(stream_), "Pa_StartStream");

    streamRate_ = sampleRate;
    streamChannels_ = channels;
}

bool PortAudioOutput::play(const PcmAudio& audio, float gain) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        pa_check(Pa_Initialize(), "Pa_Initialize");
        initialized_ = true;
    }

    reopenFor(audio.sampleRate, audio.channels);

    const size_t chunkFrames = (size_t)config_.framesPerBuffer;
    const size_t totalFrames = audio.samples.size() / audio.channels;
    std::vector<float> chunk(chunkFrames * audio.channels);

    for (size_t frame = 0; frame < totalFrames; frame += chunkFrames) {
        if (stopRequested_.load()) return false;

        const size_t frames = std::min(chunkFrames, totalFrames - frame);
        const float* src = audio.samples.data() + frame * audio.channels;
        for (size_t i = 0; i < frames * audio.channels; ++i) {
            chunk[i] = std::max(-1.0f, std::min(1.0f, src[i] * gain));
        }

        PaError e = Pa_WriteStream(stream_, chunk.data(), (unsigned long)frames);
        if (e == paOutputUnderflowed) continue;
        pa_check(e, "Pa_WriteStream");
    }
    return !stopRequested_.load();
}

}  // namespace

std::unique_ptr<AudioInput> makePortAudioInput(const AudioInput::Config& config) {
    return std::make_unique<PortAudioInput>(config);
}

std::unique_ptr<AudioOutput> makePortAudioOutput(const AudioOutput::Config& config) {
    return std::make_unique<PortAudioOutput>(config);
}

void listAudioDevices() {
    pa_check(Pa_Initialize(), "Pa_Initialize");

    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::cout << i << ": " << info->name
                  << " (in " << info->maxInputChannels
                  << ", out " << info->maxOutputChannels
                  << ", " << info->defaultSampleRate << " Hz)" << std::endl;
    }

    Pa_Terminate();
}
