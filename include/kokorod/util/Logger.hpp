/**
 * Logger.hpp - Timestamped diagnostic log
 *
 * Lines go to an append-only log file and to stderr. Standard output is
 * reserved for request acknowledgments and is never written here.
 */

#pragma once

#include <string>

namespace kokorod::log {

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

/**
 * Open (append) the log file. Missing parent directories are created.
 * @return false if the file could not be opened; logging then continues
 *         on stderr only.
 */
bool init(const std::string& path);

void shutdown();

/// Messages below this level are dropped (default: Info)
void setLevel(Level level);

/// Disable the stderr mirror (tests keep their own output readable)
void setConsoleEnabled(bool enabled);

void write(Level level, const std::string& tag, const std::string& msg);

inline void debug(const std::string& tag, const std::string& msg) { write(Level::Debug, tag, msg); }
inline void info(const std::string& tag, const std::string& msg) { write(Level::Info, tag, msg); }
inline void warn(const std::string& tag, const std::string& msg) { write(Level::Warn, tag, msg); }
inline void error(const std::string& tag, const std::string& msg) { write(Level::Error, tag, msg); }

} // namespace kokorod::log
