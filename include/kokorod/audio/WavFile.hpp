/**
 * WavFile.hpp - RIFF/WAVE read and write
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace kokorod::audio {

class WavError : public std::runtime_error {
public:
    explicit WavError(const std::string& what) : std::runtime_error(what) {}
};

struct WavData {
    std::vector<float> samples;     // Interleaved if channels > 1
    uint32_t sample_rate = 0;
    uint16_t channels = 1;
};

/**
 * Write mono IEEE float32 WAV. Samples and rate read back bit-exact.
 * @throws WavError
 */
void writeWav(const std::string& path, const std::vector<float>& samples, uint32_t sample_rate);

/**
 * Read float32, 16-bit or 24-bit PCM WAV into floats.
 * @throws WavError
 */
WavData readWav(const std::string& path);

} // namespace kokorod::audio
