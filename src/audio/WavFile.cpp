/**
 * WavFile.cpp - Minimal RIFF/WAVE codec
 *
 * Writes WAVE_FORMAT_IEEE_FLOAT so that synthesized samples survive the
 * trip through the player's file unchanged.
 */

#include "kokorod/audio/WavFile.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

namespace kokorod::audio {

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_IEEE_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

template <typename T>
void put(std::ofstream& out, T value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
T get(const std::vector<uint8_t>& data, size_t offset) {
    T value;
    std::memcpy(&value, &data[offset], sizeof(T));
    return value;
}

} // anonymous namespace

void writeWav(const std::string& path, const std::vector<float>& samples, uint32_t sample_rate) {
    std::ofstream wav(path, std::ios::binary | std::ios::trunc);
    if (!wav.good()) {
        throw WavError("Cannot open for writing: " + path);
    }

    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 32;
    const uint16_t block_align = channels * bits_per_sample / 8;
    const uint32_t byte_rate = sample_rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(float));
    const uint32_t fmt_size = 18;   // 16 + cbSize for non-PCM formats
    const uint32_t fact_size = 4;
    const uint32_t riff_size = 4 + (8 + fmt_size) + (8 + fact_size) + (8 + data_size);

    wav.write("RIFF", 4);
    put<uint32_t>(wav, riff_size);
    wav.write("WAVE", 4);

    wav.write("fmt ", 4);
    put<uint32_t>(wav, fmt_size);
    put<uint16_t>(wav, FORMAT_IEEE_FLOAT);
    put<uint16_t>(wav, channels);
    put<uint32_t>(wav, sample_rate);
    put<uint32_t>(wav, byte_rate);
    put<uint16_t>(wav, block_align);
    put<uint16_t>(wav, bits_per_sample);
    put<uint16_t>(wav, 0);          // cbSize

    wav.write("fact", 4);
    put<uint32_t>(wav, fact_size);
    put<uint32_t>(wav, static_cast<uint32_t>(samples.size()));

    wav.write("data", 4);
    put<uint32_t>(wav, data_size);
    wav.write(reinterpret_cast<const char*>(samples.data()), data_size);

    wav.flush();
    if (!wav.good()) {
        throw WavError("Write failed: " + path);
    }
}

WavData readWav(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.good()) {
        throw WavError("Cannot open: " + path);
    }

    size_t file_size = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);
    if (file_size < 12) {
        throw WavError("Not a WAV file: " + path);
    }

    std::vector<uint8_t> bytes(file_size);
    file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(file_size));

    if (std::memcmp(bytes.data(), "RIFF", 4) != 0 || std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw WavError("Invalid WAV: no RIFF/WAVE header in " + path);
    }

    uint16_t format = 0;
    uint16_t bits = 0;
    WavData wav;
    size_t data_offset = 0;
    size_t data_size = 0;

    // Walk the chunk list; chunks are word aligned
    size_t pos = 12;
    while (pos + 8 <= file_size) {
        uint32_t chunk_size = get<uint32_t>(bytes, pos + 4);
        size_t body = pos + 8;

        if (std::memcmp(&bytes[pos], "fmt ", 4) == 0 && body + 16 <= file_size) {
            format = get<uint16_t>(bytes, body);
            wav.channels = get<uint16_t>(bytes, body + 2);
            wav.sample_rate = get<uint32_t>(bytes, body + 4);
            bits = get<uint16_t>(bytes, body + 14);
            if (format == FORMAT_EXTENSIBLE && chunk_size >= 26 && body + 26 <= file_size) {
                format = get<uint16_t>(bytes, body + 24);   // First two bytes of the sub-format GUID
            }
        } else if (std::memcmp(&bytes[pos], "data", 4) == 0) {
            data_offset = body;
            data_size = std::min<size_t>(chunk_size, file_size - body);
            break;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (data_offset == 0) {
        throw WavError("Invalid WAV: no data chunk in " + path);
    }
    if (wav.channels == 0 || wav.sample_rate == 0) {
        throw WavError("Invalid WAV: missing fmt chunk in " + path);
    }

    if (format == FORMAT_IEEE_FLOAT && bits == 32) {
        size_t count = data_size / 4;
        wav.samples.resize(count);
        std::memcpy(wav.samples.data(), bytes.data() + data_offset, count * 4);
    } else if (format == FORMAT_PCM && bits == 16) {
        size_t count = data_size / 2;
        wav.samples.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            wav.samples.push_back(static_cast<float>(get<int16_t>(bytes, data_offset + i * 2)) / 32768.0f);
        }
    } else if (format == FORMAT_PCM && bits == 24) {
        size_t count = data_size / 3;
        wav.samples.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            const uint8_t* ptr = &bytes[data_offset + i * 3];
            int32_t val = (ptr[0] << 8) | (ptr[1] << 16) | (ptr[2] << 24);
            val >>= 8;  // Sign-extend
            wav.samples.push_back(static_cast<float>(val) / 8388608.0f);
        }
    } else {
        throw WavError("Unsupported WAV format " + std::to_string(format) + " / " +
                       std::to_string(bits) + " bits in " + path);
    }

    return wav;
}

} // namespace kokorod::audio
