/**
 * Command.cpp - Prefix classification
 */

#include "kokorod/daemon/Command.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace kokorod::daemon {

namespace {

struct Prefix {
    const char* token;
    CommandType type;
};

// Longest first; all prefixes currently have the same length
const std::array<Prefix, 3> PREFIXES = {{
    {"SPEAK:", CommandType::Speak},
    {"VOICE:", CommandType::Voice},
    {"SPEED:", CommandType::Speed},
}};

constexpr const char* WHITESPACE = " \t\r\n\f\v";

} // anonymous namespace

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(begin, end - begin + 1);
}

Command parseCommand(const std::string& line) {
    if (line == "QUIT") {
        return {CommandType::Quit, ""};
    }

    for (const auto& prefix : PREFIXES) {
        std::string token(prefix.token);
        if (line.compare(0, token.size(), token) == 0) {
            return {prefix.type, trim(line.substr(token.size()))};
        }
    }

    return {CommandType::Text, line};
}

std::optional<float> parseSpeed(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) return std::nullopt;

    const char* begin = value.data();
    const char* end = value.data() + value.size();
    if (*begin == '+') ++begin;   // from_chars rejects a leading '+'

    float speed = 0.0f;
    auto [ptr, ec] = std::from_chars(begin, end, speed);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    if (!std::isfinite(speed) || speed <= 0.0f) {
        return std::nullopt;
    }
    return speed;
}

const char* toString(CommandType type) {
    switch (type) {
        case CommandType::Speak: return "SPEAK";
        case CommandType::Voice: return "VOICE";
        case CommandType::Speed: return "SPEED";
        case CommandType::Quit:  return "QUIT";
        case CommandType::Text:  return "TEXT";
    }
    return "TEXT";
}

} // namespace kokorod::daemon
