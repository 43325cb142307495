/**
 * PlayerBackend.hpp - Play through an external player executable
 *
 * The WAV path is appended to the configured argument list, e.g.
 * {"aplay", "-q"} runs "aplay -q /tmp/kokorod-XXXXXX.wav".
 */

#pragma once

#include "kokorod/audio/AudioBackend.hpp"

#include <vector>

namespace kokorod::audio {

class PlayerBackend : public AudioBackend {
public:
    explicit PlayerBackend(std::vector<std::string> command);

    std::string name() const override;

    PlaybackOutcome play(const std::string& wav_path,
                         std::chrono::milliseconds timeout) override;

private:
    std::vector<std::string> command_;
};

} // namespace kokorod::audio
