/**
 * TempAudioFile.hpp - Uniquely named temporary file, removed on destruction
 */

#pragma once

#include <string>

namespace kokorod::audio {

class TempAudioFile {
public:
    /**
     * Create an empty file "<dir>/kokorod-XXXXXX<suffix>".
     * @param dir directory (empty = system temp directory)
     * @throws std::system_error
     */
    explicit TempAudioFile(const std::string& dir = "", const std::string& suffix = ".wav");
    ~TempAudioFile();

    TempAudioFile(const TempAudioFile&) = delete;
    TempAudioFile& operator=(const TempAudioFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace kokorod::audio
