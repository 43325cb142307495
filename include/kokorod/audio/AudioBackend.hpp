/**
 * AudioBackend.hpp - One way of playing a WAV file
 */

#pragma once

#include <chrono>
#include <string>

namespace kokorod::audio {

enum class PlaybackOutcome {
    Played,     // Finished successfully
    NotFound,   // Backend not installed / no device
    TimedOut,   // Gave up after the timeout
    Failed      // Ran and reported an error
};

const char* toString(PlaybackOutcome outcome);

class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    virtual std::string name() const = 0;

    /// Play the file, blocking for at most `timeout`
    virtual PlaybackOutcome play(const std::string& wav_path,
                                 std::chrono::milliseconds timeout) = 0;
};

} // namespace kokorod::audio
