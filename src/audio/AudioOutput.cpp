/**
 * AudioOutput.cpp - Backend fallback chain
 *
 * Materializes the samples once, then walks the backends in order until
 * one of them plays the file.
 */

#include "kokorod/audio/AudioOutput.hpp"
#include "kokorod/audio/PlayerBackend.hpp"
#include "kokorod/audio/PortAudioBackend.hpp"
#include "kokorod/audio/TempAudioFile.hpp"
#include "kokorod/audio/WavFile.hpp"
#include "kokorod/util/Logger.hpp"

namespace kokorod::audio {

AudioOutput::AudioOutput(std::vector<std::unique_ptr<AudioBackend>> backends,
                         std::chrono::milliseconds timeout,
                         std::string temp_dir)
    : backends_(std::move(backends))
    , timeout_(timeout)
    , temp_dir_(std::move(temp_dir)) {
}

PlaybackReport AudioOutput::play(const tts::SynthesisResult& result) {
    PlaybackReport report;

    TempAudioFile wav(temp_dir_);
    writeWav(wav.path(), result.samples, static_cast<uint32_t>(result.sample_rate));

    for (auto& backend : backends_) {
        PlaybackOutcome outcome = backend->play(wav.path(), timeout_);
        report.attempts.emplace_back(backend->name(), outcome);

        if (outcome == PlaybackOutcome::Played) {
            report.played = true;
            report.backend = backend->name();
            break;
        }

        if (outcome == PlaybackOutcome::NotFound) {
            log::debug("AudioOutput", backend->name() + ": " + toString(outcome));
        } else {
            log::warn("AudioOutput", backend->name() + ": " + toString(outcome) + ", trying next");
        }
    }

    if (!report.played) {
        log::error("AudioOutput", "No audio backend could play the file (" +
                   std::to_string(report.attempts.size()) + " tried)");
    }

    return report;
}

std::vector<std::string> AudioOutput::backendNames() const {
    std::vector<std::string> names;
    for (const auto& backend : backends_) {
        names.push_back(backend->name());
    }
    return names;
}

std::vector<std::unique_ptr<AudioBackend>> AudioOutput::makeBackends(
    const std::vector<std::vector<std::string>>& players,
    bool portaudio_fallback) {

    std::vector<std::unique_ptr<AudioBackend>> backends;
    for (const auto& command : players) {
        backends.push_back(std::make_unique<PlayerBackend>(command));
    }
    if (portaudio_fallback) {
        backends.push_back(std::make_unique<PortAudioBackend>());
    }
    return backends;
}

} // namespace kokorod::audio
