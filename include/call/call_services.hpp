#ifndef CALL_SERVICES_HPP
#define CALL_SERVICES_HPP

#include "audio/wav.hpp"
#include "core/call_events.hpp"

#include <string>

// Seams between the state machine and the subsystems it drives. Each
// implementation reports back through an EventSink, never by calling into
// the state machine.

class RecorderService {
public:
    virtual ~RecorderService() = default;

    // Throws std::runtime_error when the microphone is unavailable
    virtual void startRecording() = 0;

    // Finalizes the container and releases the microphone. Throws when idle.
    virtual AudioBytes stopRecording() = 0;

    virtual bool isRecording() const = 0;
};

class VadService {
public:
    virtual ~VadService() = default;

    // Attaches detection in the given mode. Throws when the backend fails.
    virtual void start(VadMode mode) = 0;
    virtual void stop() = 0;

    virtual bool isActive() const = 0;
    virtual VadStatus status() const = 0;
};

class SpeechService {
public:
    virtual ~SpeechService() = default;

    virtual void unlock() = 0;
    virtual void speak(const std::string& text) = 0;
    virtual void stop() = 0;

    virtual bool isPlaying() const = 0;
    virtual bool isPending() const = 0;
};

#endif
