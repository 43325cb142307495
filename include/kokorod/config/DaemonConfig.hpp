/**
 * DaemonConfig.hpp - Runtime configuration for the kokorod daemon
 *
 * Defaults live in the struct. A JSON file and the command line may
 * override them, in that order.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace kokorod::config {

/**
 * Invalid configuration file or command line
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct DaemonConfig {
    // Synthesis assets
    std::string model_path = "/opt/kokoro-tts/models/kokoro-v1.0.onnx";
    std::string voices_path = "/opt/kokoro-tts/models/voices.bin";
    std::string vocab_path;             // Empty = built-in Kokoro v1.0 vocabulary
    std::string espeak_data_path;       // Empty = espeak-ng default
    std::string default_language = "en-us";
    std::string default_voice = "af_bella";
    int intra_op_threads = 0;           // 0 = ONNX Runtime default

    // Request channel
    std::string input_path;             // Empty = stdin
    bool keep_open = false;             // Open a FIFO read-write so writers may come and go
    size_t max_line_bytes = 65536;

    // Playback
    int player_timeout_ms = 10000;
    std::string temp_dir;               // Empty = system temp directory
    std::vector<std::vector<std::string>> players = {
        {"pw-play"},
        {"paplay"},
        {"aplay", "-q"}
    };
    bool portaudio_fallback = true;

    // Diagnostics
    std::string log_path = defaultLogPath();
    bool verbose = false;

    static std::string defaultLogPath();
};

/**
 * Overlay the keys present in a JSON file onto `config`.
 * @throws ConfigError if the file is unreadable, not JSON, or a key has the wrong type
 */
void loadConfigFile(const std::string& path, DaemonConfig& config);

/**
 * Overlay keys from a JSON document (already read into memory).
 * @throws ConfigError
 */
void applyConfigJson(const std::string& json_text, DaemonConfig& config);

/**
 * Command-line options that do not map onto DaemonConfig
 */
struct CommandLine {
    std::string config_path;
    bool list_voices = false;
    bool show_help = false;
};

/**
 * Parse argv. A --config file is loaded first so that explicit flags win.
 * @throws ConfigError on unknown flags or missing values
 */
CommandLine parseCommandLine(int argc, char* argv[], DaemonConfig& config);

std::string usage(const std::string& program);

} // namespace kokorod::config
