/**
 * Daemon.cpp - Command loop
 *
 * Every handled line produces exactly one OK/ERROR on the ack stream.
 * Nothing thrown while handling a line escapes handleLine().
 */

#include "kokorod/Daemon.hpp"
#include "kokorod/util/Logger.hpp"

#include <chrono>
#include <sstream>

namespace kokorod {

namespace {

std::string preview(const std::string& text, size_t max_chars = 50) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

} // anonymous namespace

const char* toString(Ack ack) {
    return ack == Ack::Ok ? "OK" : "ERROR";
}

Daemon::Daemon(tts::SynthesisEngine& engine,
               audio::AudioOutput& output,
               std::ostream& acks,
               const std::string& default_voice)
    : engine_(engine)
    , output_(output)
    , acks_(acks)
    , voices_(engine.listVoices()) {

    if (voices_.empty()) {
        throw tts::LoadError("Synthesis engine reports no voices");
    }

    if (voices_.count(default_voice)) {
        session_.active_voice = default_voice;
    } else {
        session_.active_voice = *voices_.begin();
        log::warn("Daemon", "Default voice '" + default_voice + "' not available, using '" +
                  session_.active_voice + "'");
    }

    log::info("Daemon", "Voice: " + session_.active_voice + " (" +
              std::to_string(voices_.size()) + " available)");
}

int Daemon::run(daemon::LineReader& reader) {
    log::info("Daemon", "Ready, waiting for requests...");

    std::string line;
    int status = 0;
    std::string reason = "stop requested";

    reader_ = &reader;
    while (session_.running) {
        daemon::ReadStatus result = reader.readLine(line);

        if (result == daemon::ReadStatus::EndOfStream) {
            reason = "end of input";
            break;
        }
        if (result == daemon::ReadStatus::Interrupted) {
            continue;   // Loop condition sees a stop request
        }
        if (result == daemon::ReadStatus::Error) {
            log::error("Daemon", "Read failed: " + reader.lastError());
            reason = "read error";
            status = 1;
            break;
        }
        if (result == daemon::ReadStatus::TooLong) {
            log::error("Daemon", "Request line too long, discarded");
            acknowledge(Ack::Error);
            continue;
        }

        std::optional<Ack> ack = handleLine(line);
        if (ack) {
            acknowledge(*ack);
        }
    }

    reader_ = nullptr;

    log::info("Daemon", "Shutting down (" + reason + ")");
    return status;
}

void Daemon::requestStop() noexcept {
    session_.running = false;
    if (daemon::LineReader* reader = reader_.load()) {
        reader->wakeup();
    }
}

std::optional<Ack> Daemon::handleLine(const std::string& raw_line) {
    std::string line = daemon::trim(raw_line);
    if (line.empty()) {
        return std::nullopt;
    }

    try {
        daemon::Command command = daemon::parseCommand(line);

        if (command.type == daemon::CommandType::Quit) {
            log::info("Daemon", "Quit command received");
            session_.running = false;
            return std::nullopt;
        }

        log::debug("Daemon", std::string("Request: ") + daemon::toString(command.type));

        return dispatch(command);
    } catch (const std::exception& e) {
        log::error("Daemon", std::string("Error processing request: ") + e.what());
        return Ack::Error;
    }
}

Ack Daemon::dispatch(const daemon::Command& command) {
    switch (command.type) {
        case daemon::CommandType::Speak:
        case daemon::CommandType::Text:
            return speak(command.argument);
        case daemon::CommandType::Voice:
            return changeVoice(command.argument);
        case daemon::CommandType::Speed:
            return changeSpeed(command.argument);
        case daemon::CommandType::Quit:
            break;
    }
    return Ack::Error;
}

Ack Daemon::speak(const std::string& text) {
    if (text.empty()) {
        log::warn("Daemon", "SPEAK without text");
        return Ack::Error;
    }

    std::ostringstream msg;
    msg << "Generating speech with voice '" << session_.active_voice << "' speed "
        << session_.speech_rate << ": " << preview(text);
    log::info("Daemon", msg.str());

    try {
        auto start = std::chrono::steady_clock::now();
        tts::SynthesisResult result = engine_.synthesize(text, session_.active_voice, session_.speech_rate);
        auto synth_time = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);

        audio::PlaybackReport report = output_.play(result);
        if (!report.played) {
            log::error("Daemon", "Playback failed on every backend");
            return Ack::Error;
        }

        std::ostringstream done;
        done << "Speech completed via " << report.backend << " (" << result.durationSeconds()
             << "s audio, synthesis " << synth_time.count() << "s)";
        log::info("Daemon", done.str());
        return Ack::Ok;
    } catch (const tts::SynthesisError& e) {
        log::error("Daemon", std::string("Synthesis failed: ") + e.what());
    } catch (const std::exception& e) {
        log::error("Daemon", std::string("Error generating speech: ") + e.what());
    }
    return Ack::Error;
}

Ack Daemon::changeVoice(const std::string& voice) {
    if (!voices_.count(voice)) {
        log::warn("Daemon", "Voice '" + voice + "' not available, keeping '" + session_.active_voice + "'");
        return Ack::Error;
    }
    session_.active_voice = voice;
    log::info("Daemon", "Voice changed to: " + voice);
    return Ack::Ok;
}

Ack Daemon::changeSpeed(const std::string& value) {
    std::optional<float> speed = daemon::parseSpeed(value);
    if (!speed) {
        log::warn("Daemon", "Invalid speed '" + value + "', keeping " + std::to_string(session_.speech_rate));
        return Ack::Error;
    }
    session_.speech_rate = *speed;
    log::info("Daemon", "Speed changed to: " + std::to_string(*speed));
    return Ack::Ok;
}

void Daemon::acknowledge(Ack ack) {
    acks_ << toString(ack) << std::endl;    // endl flushes
}

} // namespace kokorod
