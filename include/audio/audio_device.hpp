#ifndef AUDIO_DEVICE_HPP
#define AUDIO_DEVICE_HPP

#include "audio/wav.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// Microphone stream. Every consumer (recorder, each VAD backend) opens its own.
class AudioInput {
public:
    using FrameCallback = std::function<void(const int16_t* samples, int frames)>;
    // Called once from the capture thread when the stream dies; no frames follow
    using ErrorCallback = std::function<void(const std::string& error)>;

    struct Config {
        int device = -1;            // -1 = default input
        int sampleRate = 16000;
        int framesPerBuffer = 512;
    };

    virtual ~AudioInput() = default;

    // Throws std::runtime_error when the device cannot be opened
    virtual void start(FrameCallback callback, ErrorCallback onError) = 0;
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
    virtual int sampleRate() const = 0;
};

using AudioInputFactory = std::function<std::unique_ptr<AudioInput>()>;

// Speaker. play() blocks until the buffer finished or stop() was called.
class AudioOutput {
public:
    struct Config {
        int device = -1;            // -1 = default output
        int framesPerBuffer = 256;
    };

    virtual ~AudioOutput() = default;

    virtual void open() = 0;
    virtual void close() = 0;

    // Returns false when playback was cut short by stop()
    virtual bool play(const PcmAudio& audio, float gain) = 0;

    // stop() holds until resume(), so a play() racing a stop() returns at once
    virtual void stop() = 0;
    virtual void resume() = 0;
};

std::unique_ptr<AudioInput> makePortAudioInput(const AudioInput::Config& config);
std::unique_ptr<AudioOutput> makePortAudioOutput(const AudioOutput::Config& config);

// Prints the PortAudio device table to stdout
void listAudioDevices();

#endif
