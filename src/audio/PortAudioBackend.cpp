/**
 * PortAudioBackend.cpp - Blocking PortAudio playback of a WAV file
 */

#include "kokorod/audio/PortAudioBackend.hpp"
#include "kokorod/audio/WavFile.hpp"
#include "kokorod/util/Logger.hpp"

#include <algorithm>

#include <portaudio.h>

namespace kokorod::audio {

namespace {

// Pa_Initialize / Pa_Terminate pair for the duration of one playback
struct PaLibrary {
    PaError err;
    PaLibrary() : err(Pa_Initialize()) {}
    ~PaLibrary() {
        if (err == paNoError) Pa_Terminate();
    }
};

// Closes the stream on every exit path
struct PaStreamGuard {
    PaStream* stream = nullptr;
    ~PaStreamGuard() {
        if (stream) Pa_CloseStream(stream);
    }
};

} // anonymous namespace

PortAudioBackend::PortAudioBackend(unsigned long frames_per_buffer)
    : frames_per_buffer_(frames_per_buffer) {
}

PlaybackOutcome PortAudioBackend::play(const std::string& wav_path,
                                       std::chrono::milliseconds timeout) {
    WavData wav;
    try {
        wav = readWav(wav_path);
    } catch (const WavError& e) {
        log::warn("PortAudioBackend", e.what());
        return PlaybackOutcome::Failed;
    }

    PaLibrary library;
    if (library.err != paNoError) {
        log::debug("PortAudioBackend", std::string("Pa_Initialize failed: ") + Pa_GetErrorText(library.err));
        return PlaybackOutcome::NotFound;
    }

    PaStreamParameters output_params;
    output_params.device = Pa_GetDefaultOutputDevice();
    if (output_params.device == paNoDevice) {
        log::debug("PortAudioBackend", "No output device available");
        return PlaybackOutcome::NotFound;
    }

    output_params.channelCount = wav.channels;
    output_params.sampleFormat = paFloat32;
    output_params.suggestedLatency = Pa_GetDeviceInfo(output_params.device)->defaultHighOutputLatency;
    output_params.hostApiSpecificStreamInfo = nullptr;

    PaStreamGuard guard;
    PaError err = Pa_OpenStream(
        &guard.stream,
        nullptr,  // No input
        &output_params,
        wav.sample_rate,
        frames_per_buffer_,
        paClipOff,
        nullptr,  // Blocking I/O
        nullptr
    );

    if (err != paNoError) {
        log::warn("PortAudioBackend", std::string("Pa_OpenStream failed: ") + Pa_GetErrorText(err));
        guard.stream = nullptr;
        return PlaybackOutcome::Failed;
    }

    err = Pa_StartStream(guard.stream);
    if (err != paNoError) {
        log::warn("PortAudioBackend", std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err));
        return PlaybackOutcome::Failed;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    const size_t frames = wav.samples.size() / wav.channels;
    size_t written = 0;

    while (written < frames) {
        if (std::chrono::steady_clock::now() >= deadline) {
            Pa_AbortStream(guard.stream);
            return PlaybackOutcome::TimedOut;
        }

        unsigned long chunk = static_cast<unsigned long>(
            std::min<size_t>(frames_per_buffer_, frames - written));
        err = Pa_WriteStream(guard.stream, wav.samples.data() + written * wav.channels, chunk);
        if (err != paNoError && err != paOutputUnderflowed) {
            log::warn("PortAudioBackend", std::string("Pa_WriteStream failed: ") + Pa_GetErrorText(err));
            Pa_AbortStream(guard.stream);
            return PlaybackOutcome::Failed;
        }
        written += chunk;
    }

    // Drains the buffered audio
    err = Pa_StopStream(guard.stream);
    if (err != paNoError) {
        log::warn("PortAudioBackend", std::string("Pa_StopStream failed: ") + Pa_GetErrorText(err));
        return PlaybackOutcome::Failed;
    }

    return PlaybackOutcome::Played;
}

} // namespace kokorod::audio
