/**
 * Daemon.hpp - Request loop: read a line, act on it, acknowledge it
 *
 * One line is handled to completion (synthesis, playback, ack) before
 * the next one is read.
 */

#pragma once

#include "kokorod/audio/AudioOutput.hpp"
#include "kokorod/daemon/Command.hpp"
#include "kokorod/daemon/LineReader.hpp"
#include "kokorod/daemon/Session.hpp"
#include "kokorod/tts/SynthesisEngine.hpp"

#include <atomic>
#include <optional>
#include <ostream>
#include <set>
#include <string>

namespace kokorod {

enum class Ack {
    Ok,
    Error
};

const char* toString(Ack ack);

class Daemon {
public:
    /**
     * @param engine        synthesis engine (voice catalog is read once here)
     * @param output        playback chain
     * @param acks          acknowledgment stream (stdout in production)
     * @param default_voice initial voice; the first catalog voice is used if absent
     * @throws tts::LoadError if the engine reports no voices
     */
    Daemon(tts::SynthesisEngine& engine,
           audio::AudioOutput& output,
           std::ostream& acks,
           const std::string& default_voice);

    /**
     * Read and handle lines until QUIT, end-of-stream or requestStop().
     * @return process exit status (0 on clean shutdown)
     */
    int run(daemon::LineReader& reader);

    /**
     * Handle one raw line. Never throws.
     * @return the acknowledgment, or nothing for blank lines and QUIT
     */
    std::optional<Ack> handleLine(const std::string& raw_line);

    /// Async-signal-safe; also wakes a read blocked inside run()
    void requestStop() noexcept;

    bool isRunning() const { return session_.running; }

    const daemon::Session& session() const { return session_; }
    const std::set<std::string>& voices() const { return voices_; }

private:
    Ack dispatch(const daemon::Command& command);
    Ack speak(const std::string& text);
    Ack changeVoice(const std::string& voice);
    Ack changeSpeed(const std::string& value);
    void acknowledge(Ack ack);

    tts::SynthesisEngine& engine_;
    audio::AudioOutput& output_;
    std::ostream& acks_;
    std::set<std::string> voices_;
    daemon::Session session_;
    std::atomic<daemon::LineReader*> reader_{nullptr};
};

} // namespace kokorod
