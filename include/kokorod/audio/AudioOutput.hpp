/**
 * AudioOutput.hpp - Play synthesized audio through a backend fallback chain
 */

#pragma once

#include "kokorod/audio/AudioBackend.hpp"
#include "kokorod/tts/SynthesisEngine.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kokorod::audio {

struct PlaybackReport {
    bool played = false;
    std::string backend;    // Backend that played the audio (empty if none)
    std::vector<std::pair<std::string, PlaybackOutcome>> attempts;
};

class AudioOutput {
public:
    /**
     * @param backends tried in order; the first to report Played wins
     * @param timeout  per-backend bound
     * @param temp_dir where the WAV is materialized (empty = system temp)
     */
    AudioOutput(std::vector<std::unique_ptr<AudioBackend>> backends,
                std::chrono::milliseconds timeout,
                std::string temp_dir = "");

    /**
     * Write the samples to a temporary WAV and try each backend. The file
     * is removed before returning.
     * @throws WavError / std::system_error if the file cannot be written
     */
    PlaybackReport play(const tts::SynthesisResult& result);

    std::vector<std::string> backendNames() const;

    /**
     * External players in the given order, then PortAudio if enabled
     */
    static std::vector<std::unique_ptr<AudioBackend>> makeBackends(
        const std::vector<std::vector<std::string>>& players,
        bool portaudio_fallback);

private:
    std::vector<std::unique_ptr<AudioBackend>> backends_;
    std::chrono::milliseconds timeout_;
    std::string temp_dir_;
};

} // namespace kokorod::audio
