/**
 * PortAudioBackend.hpp - In-process playback on the default output device
 *
 * Last resort when no external player is installed.
 */

#pragma once

#include "kokorod/audio/AudioBackend.hpp"

namespace kokorod::audio {

class PortAudioBackend : public AudioBackend {
public:
    explicit PortAudioBackend(unsigned long frames_per_buffer = 1024);

    std::string name() const override { return "portaudio"; }

    PlaybackOutcome play(const std::string& wav_path,
                         std::chrono::milliseconds timeout) override;

private:
    unsigned long frames_per_buffer_;
};

} // namespace kokorod::audio
