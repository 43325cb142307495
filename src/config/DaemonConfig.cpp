/**
 * DaemonConfig.cpp - JSON config file + command line parsing
 */

#include "kokorod/config/DaemonConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kokorod::config {

namespace {

template <typename T>
void readKey(const json& root, const char* key, T& target) {
    if (!root.contains(key) || root[key].is_null()) return;
    try {
        target = root[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return result;
    } catch (const std::exception&) {
        throw ConfigError("Expected an integer for " + flag + ", got '" + value + "'");
    }
}

} // anonymous namespace

std::string DaemonConfig::defaultLogPath() {
    const char* home = std::getenv("HOME");
    std::string base = (home && *home) ? home : "/tmp";
    return base + "/.cache/kokoro-tts/kokoro-tts.log";
}

void applyConfigJson(const std::string& json_text, DaemonConfig& config) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
    }

    if (!root.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    readKey(root, "model_path", config.model_path);
    readKey(root, "voices_path", config.voices_path);
    readKey(root, "vocab_path", config.vocab_path);
    readKey(root, "espeak_data_path", config.espeak_data_path);
    readKey(root, "default_language", config.default_language);
    readKey(root, "default_voice", config.default_voice);
    readKey(root, "intra_op_threads", config.intra_op_threads);
    readKey(root, "input_path", config.input_path);
    readKey(root, "keep_open", config.keep_open);
    readKey(root, "max_line_bytes", config.max_line_bytes);
    readKey(root, "player_timeout_ms", config.player_timeout_ms);
    readKey(root, "temp_dir", config.temp_dir);
    readKey(root, "players", config.players);
    readKey(root, "portaudio_fallback", config.portaudio_fallback);
    readKey(root, "log_path", config.log_path);
    readKey(root, "verbose", config.verbose);

    for (const auto& player : config.players) {
        if (player.empty() || player.front().empty()) {
            throw ConfigError("Each entry in 'players' needs a program name");
        }
    }
    if (config.player_timeout_ms <= 0) {
        throw ConfigError("'player_timeout_ms' must be positive");
    }
    if (config.max_line_bytes == 0) {
        throw ConfigError("'max_line_bytes' must be positive");
    }
}

void loadConfigFile(const std::string& path, DaemonConfig& config) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("Cannot read config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    applyConfigJson(buffer.str(), config);
}

CommandLine parseCommandLine(int argc, char* argv[], DaemonConfig& config) {
    CommandLine cmd;
    std::vector<std::string> args(argv + 1, argv + argc);

    // The config file is applied before any flag regardless of position
    for (size_t i = 0; i < args.size(); ++i) {
        if ((args[i] == "-c" || args[i] == "--config") && i + 1 < args.size()) {
            cmd.config_path = args[i + 1];
        }
    }
    if (!cmd.config_path.empty()) {
        loadConfigFile(cmd.config_path, config);
    }

    auto needValue = [&](size_t i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw ConfigError("Missing value for " + args[i]);
        }
        return args[i + 1];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            cmd.show_help = true;
        } else if (arg == "-c" || arg == "--config") {
            needValue(i);
            ++i;
        } else if (arg == "-m" || arg == "--model") {
            config.model_path = needValue(i);
            ++i;
        } else if (arg == "-b" || arg == "--voices") {
            config.voices_path = needValue(i);
            ++i;
        } else if (arg == "-v" || arg == "--voice") {
            config.default_voice = needValue(i);
            ++i;
        } else if (arg == "-i" || arg == "--input") {
            config.input_path = needValue(i);
            ++i;
        } else if (arg == "--keep-open") {
            config.keep_open = true;
        } else if (arg == "-l" || arg == "--log") {
            config.log_path = needValue(i);
            ++i;
        } else if (arg == "-t" || arg == "--timeout-ms") {
            config.player_timeout_ms = parseInt(arg, needValue(i));
            if (config.player_timeout_ms <= 0) {
                throw ConfigError("--timeout-ms must be positive");
            }
            ++i;
        } else if (arg == "--list-voices") {
            cmd.list_voices = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }

    return cmd;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + R"( [OPTIONS]

Text-to-speech request daemon. Reads one command per line and writes
OK or ERROR to stdout for each.

Commands:
  SPEAK:<text>      Synthesize and play text
  VOICE:<id>        Select a voice from the voice bank
  SPEED:<float>     Set the speaking rate (1.0 = normal)
  QUIT              Stop the daemon
  <anything else>   Spoken verbatim

Options:
  -c, --config <path>     JSON configuration file
  -m, --model <path>      Kokoro ONNX model (default: /opt/kokoro-tts/models/kokoro-v1.0.onnx)
  -b, --voices <path>     Voice bank (default: /opt/kokoro-tts/models/voices.bin)
  -v, --voice <id>        Initial voice (default: af_bella)
  -i, --input <path>      Read commands from this file or FIFO instead of stdin
      --keep-open         Keep a FIFO open across writer disconnects
  -l, --log <path>        Log file (default: ~/.cache/kokoro-tts/kokoro-tts.log)
  -t, --timeout-ms <ms>   Per-player playback timeout (default: 10000)
      --list-voices       Print the available voices and exit
      --verbose           Log debug messages
  -h, --help              Show this help and exit
)";
}

} // namespace kokorod::config
