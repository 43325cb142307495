/**
 * Logger.cpp - File + stderr logging with timestamps
 */

#include "kokorod/util/Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace kokorod::log {

namespace fs = std::filesystem;

namespace {

std::mutex g_mutex;
std::ofstream g_file;
Level g_level = Level::Info;
bool g_console = true;

std::string nowTimestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char* levelName(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

} // anonymous namespace

bool init(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_mutex);

    if (g_file.is_open()) {
        g_file.close();
    }

    fs::path log_path(path);
    std::error_code ec;
    if (log_path.has_parent_path()) {
        fs::create_directories(log_path.parent_path(), ec);
    }

    g_file.open(log_path, std::ios::out | std::ios::app);
    if (!g_file.is_open()) {
        std::cerr << "[" << nowTimestamp() << "][ERROR][Logger] Could not open log file: "
                  << path << std::endl;
        return false;
    }
    return true;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file.is_open()) {
        g_file.close();
    }
}

void setLevel(Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
}

void setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_console = enabled;
}

void write(Level level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (level < g_level) return;

    std::string line = "[" + nowTimestamp() + "][" + levelName(level) + "][" + tag + "] " + msg;

    if (g_file.is_open()) {
        g_file << line << '\n';
        g_file.flush();
    }
    if (g_console) {
        std::cerr << line << std::endl;
    }
}

} // namespace kokorod::log
