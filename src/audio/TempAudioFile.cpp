/**
 * TempAudioFile.cpp - mkstemps-backed scoped temp file
 */

#include "kokorod/audio/TempAudioFile.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace kokorod::audio {

namespace fs = std::filesystem;

TempAudioFile::TempAudioFile(const std::string& dir, const std::string& suffix) {
    fs::path base = dir.empty() ? fs::temp_directory_path() : fs::path(dir);
    std::string pattern = (base / ("kokorod-XXXXXX" + suffix)).string();

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = ::mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "mkstemps " + pattern);
    }
    ::close(fd);

    path_ = buffer.data();
}

TempAudioFile::~TempAudioFile() {
    std::error_code ec;
    fs::remove(path_, ec);
}

} // namespace kokorod::audio
