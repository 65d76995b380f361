#include "asr/whisper_transcriber.hpp"
#include "audio/resampler.hpp"

#include <whisper.h>

#include <iostream>
#include <stdexcept>
#include <utility>

// Constructor
WhisperTranscriber::WhisperTranscriber(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + config_.modelPath);
}

// Destructor
WhisperTranscriber::~WhisperTranscriber() {
    if (context_) whisper_free(context_);
}

// Decodes the container and converts it to 16 kHz mono floats
TranscriptResult WhisperTranscriber::transcribe(const AudioBytes& audio) {
    PcmAudio pcm = decodeWav(audio);

    std::vector<float> mono;
    const int ch = pcm.channels > 0 ? pcm.channels : 1;
    mono.reserve(pcm.samples.size() / ch);
    for (size_t i = 0; i + ch <= pcm.samples.size(); i += ch) {
        float sum = 0.0f;
        for (int c = 0; c < ch; ++c) sum += pcm.samples[i + c];
        mono.push_back(sum / ch);
    }

    if (pcm.sampleRate != 16000 && !mono.empty()) {
        std::vector<int16_t> in = floatToPcm16(mono.data(), mono.size());
        Resampler resampler(pcm.sampleRate, 16000);
        std::vector<int16_t> out = resampler.process(in.data(), in.size());
        mono.resize(out.size());
        for (size_t i = 0; i < out.size(); ++i) mono[i] = out[i] / 32768.0f;
    }

    return transcribePcm(mono);
}

TranscriptResult WhisperTranscriber::transcribePcm(const std::vector<float>& pcm16kMono) {
    TranscriptResult out;
    if (pcm16kMono.empty()) return out;

    std::lock_guard<std::mutex> lock(mutex_);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (rc != 0) throw std::runtime_error("whisper_full failed");

    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) {
        TranscriptSegment seg;
        seg.text = whisper_full_get_segment_text(context_, i);
        // Timestamps come back in centiseconds
        seg.start = whisper_full_get_segment_t0(context_, i) / 100.0;
        seg.end = whisper_full_get_segment_t1(context_, i) / 100.0;
        out.text += seg.text;
        out.segments.push_back(std::move(seg));
    }

    const size_t first = out.text.find_first_not_of(" \t\n");
    out.text = first == std::string::npos ? std::string() : out.text.substr(first);
    out.success = !out.text.empty();

    std::cout << "[Whisper] " << n_segments << " segment(s)" << std::endl;
    return out;
}
