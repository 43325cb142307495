/**
 * Command.hpp - Line protocol parsing
 *
 * Prefixes are reserved words: any text starting with SPEAK:, VOICE: or
 * SPEED:, or exactly equal to QUIT, is read as a command and never spoken
 * literally. There is no escaping.
 */

#pragma once

#include <optional>
#include <string>

namespace kokorod::daemon {

enum class CommandType {
    Speak,  // SPEAK:<text>
    Voice,  // VOICE:<id>
    Speed,  // SPEED:<float>
    Quit,   // QUIT
    Text    // Anything else, spoken verbatim
};

struct Command {
    CommandType type = CommandType::Text;
    std::string argument;   // Trimmed text after the prefix (whole line for Text)
};

/// Strip leading/trailing ASCII whitespace
std::string trim(const std::string& text);

/// Classify an already trimmed, non-empty line
Command parseCommand(const std::string& line);

/// A finite rate > 0, or nothing
std::optional<float> parseSpeed(const std::string& text);

const char* toString(CommandType type);

} // namespace kokorod::daemon
