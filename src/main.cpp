/**
 * kokorod - Main Entry Point
 *
 * Local text-to-speech request daemon backed by the Kokoro v1.0 model.
 * Commands arrive one per line; each is acknowledged with OK or ERROR on
 * stdout.
 */

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <system_error>

#include <unistd.h>

#include "kokorod/Daemon.hpp"
#include "kokorod/audio/AudioOutput.hpp"
#include "kokorod/config/DaemonConfig.hpp"
#include "kokorod/daemon/LineReader.hpp"
#include "kokorod/tts/KokoroEngine.hpp"
#include "kokorod/tts/VoiceBank.hpp"
#include "kokorod/util/Logger.hpp"

using namespace kokorod;

namespace {

kokorod::Daemon* g_daemon = nullptr;

void signalHandler(int) {
    if (g_daemon) {
        g_daemon->requestStop();
    }
}

void installSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;    // No SA_RESTART: a blocked read returns EINTR
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A player or ack reader going away must not kill the daemon
    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

int listVoices(const config::DaemonConfig& cfg) {
    try {
        tts::VoiceBank bank = tts::VoiceBank::load(cfg.voices_path);
        for (const auto& name : bank.names()) {
            std::cout << name << "\n";
        }
        std::cout.flush();
        return 0;
    } catch (const tts::LoadError& e) {
        std::cerr << "kokorod: " << e.what() << std::endl;
        return 1;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    config::DaemonConfig cfg;
    config::CommandLine cmd;

    try {
        cmd = config::parseCommandLine(argc, argv, cfg);
    } catch (const config::ConfigError& e) {
        std::cerr << "kokorod: " << e.what() << "\n\n" << config::usage(argv[0]);
        return 2;
    }

    if (cmd.show_help) {
        std::cout << config::usage(argv[0]);
        return 0;
    }
    if (cmd.list_voices) {
        return listVoices(cfg);
    }

    if (cfg.verbose) {
        log::setLevel(log::Level::Debug);
    }
    if (!log::init(cfg.log_path)) {
        log::warn("Main", "Cannot open log file " + cfg.log_path + ", logging to stderr only");
    }

    log::info("Main", "Starting kokorod");
    if (!cmd.config_path.empty()) {
        log::info("Main", "Config: " + cmd.config_path);
    }

    std::unique_ptr<tts::KokoroEngine> engine;
    try {
        log::info("Main", "Loading Kokoro model...");
        tts::KokoroOptions options;
        options.vocab_path = cfg.vocab_path;
        options.espeak_data_path = cfg.espeak_data_path;
        options.default_language = cfg.default_language;
        options.intra_op_threads = cfg.intra_op_threads;
        engine = std::make_unique<tts::KokoroEngine>(cfg.model_path, cfg.voices_path, options);
    } catch (const tts::LoadError& e) {
        log::error("Main", std::string("Failed to load model: ") + e.what());
        log::shutdown();
        return 1;
    } catch (const std::exception& e) {
        log::error("Main", std::string("Unexpected error while loading: ") + e.what());
        log::shutdown();
        return 1;
    }

    audio::AudioOutput output(
        audio::AudioOutput::makeBackends(cfg.players, cfg.portaudio_fallback),
        std::chrono::milliseconds(cfg.player_timeout_ms),
        cfg.temp_dir);

    std::string chain;
    for (const auto& name : output.backendNames()) {
        chain += (chain.empty() ? "" : " -> ") + name;
    }
    log::info("Main", "Playback chain: " + chain);

    int status = 0;
    try {
        Daemon server(*engine, output, std::cout, cfg.default_voice);

        int fd = STDIN_FILENO;
        bool owns_fd = false;
        if (!cfg.input_path.empty()) {
            fd = daemon::LineReader::openInput(cfg.input_path, cfg.keep_open);
            owns_fd = true;
            log::info("Main", "Reading requests from " + cfg.input_path +
                      (cfg.keep_open ? " (kept open)" : ""));
        }
        daemon::LineReader reader(fd, cfg.max_line_bytes, owns_fd);

        g_daemon = &server;
        installSignalHandlers();

        status = server.run(reader);

        g_daemon = nullptr;
    } catch (const tts::LoadError& e) {
        log::error("Main", e.what());
        status = 1;
    } catch (const std::system_error& e) {
        log::error("Main", std::string("Cannot open input: ") + e.what());
        status = 1;
    }

    log::info("Main", "Goodbye");
    log::shutdown();
    return status;
}
