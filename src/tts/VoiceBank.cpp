/**
 * VoiceBank.cpp - .npz voice bank reader
 *
 * voices.bin is a zip archive written by numpy.savez: one "<voice>.npy"
 * entry per voice, stored or deflated, possibly with zip64 extra fields.
 */

#include "kokorod/tts/VoiceBank.hpp"
#include "kokorod/tts/SynthesisEngine.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <zlib.h>

namespace kokorod::tts {

namespace {

constexpr uint32_t ZIP_LOCAL_HEADER = 0x04034b50;
constexpr uint32_t ZIP_CENTRAL_HEADER = 0x02014b50;
constexpr uint32_t ZIP_END_OF_CENTRAL_DIR = 0x06054b50;
constexpr uint32_t ZIP64_END_OF_CENTRAL_DIR = 0x06064b50;
constexpr uint32_t ZIP64_LOCATOR = 0x07064b50;
constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;

constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data) {}

    void require(size_t offset, size_t length) const {
        if (offset > data_.size() || length > data_.size() - offset) {
            throw LoadError("Voice bank is truncated");
        }
    }

    uint16_t u16(size_t offset) const {
        require(offset, 2);
        return static_cast<uint16_t>(data_[offset] | (data_[offset + 1] << 8));
    }

    uint32_t u32(size_t offset) const {
        require(offset, 4);
        return static_cast<uint32_t>(data_[offset]) |
               (static_cast<uint32_t>(data_[offset + 1]) << 8) |
               (static_cast<uint32_t>(data_[offset + 2]) << 16) |
               (static_cast<uint32_t>(data_[offset + 3]) << 24);
    }

    uint64_t u64(size_t offset) const {
        return static_cast<uint64_t>(u32(offset)) |
               (static_cast<uint64_t>(u32(offset + 4)) << 32);
    }

    size_t size() const { return data_.size(); }
    const uint8_t* at(size_t offset) const { return data_.data() + offset; }

private:
    const std::vector<uint8_t>& data_;
};

struct ZipEntry {
    std::string name;
    uint16_t method = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_offset = 0;
};

size_t findEndOfCentralDir(const ByteReader& zip) {
    if (zip.size() < 22) {
        throw LoadError("Voice bank is not a zip archive (too small)");
    }
    // The record is followed by at most a 64 KiB comment
    size_t lowest = zip.size() > 22 + 0xFFFF ? zip.size() - 22 - 0xFFFF : 0;
    for (size_t pos = zip.size() - 22 + 1; pos-- > lowest;) {
        if (zip.u32(pos) == ZIP_END_OF_CENTRAL_DIR) {
            return pos;
        }
    }
    throw LoadError("Voice bank is not a zip archive (no end of central directory)");
}

std::vector<ZipEntry> readCentralDirectory(const ByteReader& zip) {
    size_t eocd = findEndOfCentralDir(zip);

    uint64_t entry_count = zip.u16(eocd + 10);
    uint64_t cd_offset = zip.u32(eocd + 16);

    if (entry_count == 0xFFFF || cd_offset == 0xFFFFFFFF) {
        if (eocd < 20 || zip.u32(eocd - 20) != ZIP64_LOCATOR) {
            throw LoadError("Voice bank zip64 locator missing");
        }
        uint64_t zip64_eocd = zip.u64(eocd - 20 + 8);
        if (zip.u32(zip64_eocd) != ZIP64_END_OF_CENTRAL_DIR) {
            throw LoadError("Voice bank zip64 directory record missing");
        }
        entry_count = zip.u64(zip64_eocd + 32);
        cd_offset = zip.u64(zip64_eocd + 48);
    }

    std::vector<ZipEntry> entries;
    size_t pos = cd_offset;

    for (uint64_t i = 0; i < entry_count; ++i) {
        if (zip.u32(pos) != ZIP_CENTRAL_HEADER) {
            throw LoadError("Voice bank central directory is corrupt");
        }

        ZipEntry entry;
        entry.method = zip.u16(pos + 10);
        entry.compressed_size = zip.u32(pos + 20);
        entry.uncompressed_size = zip.u32(pos + 24);
        uint16_t name_len = zip.u16(pos + 28);
        uint16_t extra_len = zip.u16(pos + 30);
        uint16_t comment_len = zip.u16(pos + 32);
        entry.local_offset = zip.u32(pos + 42);

        zip.require(pos + 46, name_len);
        entry.name.assign(reinterpret_cast<const char*>(zip.at(pos + 46)), name_len);

        // Zip64 extra field carries the values that overflowed 32 bits, in order
        size_t extra = pos + 46 + name_len;
        size_t extra_end = extra + extra_len;
        while (extra + 4 <= extra_end) {
            uint16_t id = zip.u16(extra);
            uint16_t len = zip.u16(extra + 2);
            if (id == ZIP64_EXTRA_ID) {
                size_t field = extra + 4;
                if (entry.uncompressed_size == 0xFFFFFFFF) {
                    entry.uncompressed_size = zip.u64(field);
                    field += 8;
                }
                if (entry.compressed_size == 0xFFFFFFFF) {
                    entry.compressed_size = zip.u64(field);
                    field += 8;
                }
                if (entry.local_offset == 0xFFFFFFFF) {
                    entry.local_offset = zip.u64(field);
                }
            }
            extra += 4 + len;
        }

        entries.push_back(std::move(entry));
        pos += 46 + name_len + extra_len + comment_len;
    }

    return entries;
}

std::vector<uint8_t> extractEntry(const ByteReader& zip, const ZipEntry& entry) {
    size_t local = entry.local_offset;
    if (zip.u32(local) != ZIP_LOCAL_HEADER) {
        throw LoadError("Voice bank entry '" + entry.name + "' has no local header");
    }
    size_t data_offset = local + 30 + zip.u16(local + 26) + zip.u16(local + 28);
    zip.require(data_offset, entry.compressed_size);

    if (entry.method == METHOD_STORED) {
        return std::vector<uint8_t>(zip.at(data_offset), zip.at(data_offset) + entry.compressed_size);
    }

    if (entry.method != METHOD_DEFLATED) {
        throw LoadError("Voice bank entry '" + entry.name + "' uses unsupported compression " +
                        std::to_string(entry.method));
    }

    std::vector<uint8_t> out(entry.uncompressed_size);
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw LoadError("zlib inflateInit2 failed");
    }
    zs.next_in = const_cast<Bytef*>(zip.at(data_offset));
    zs.avail_in = static_cast<uInt>(entry.compressed_size);
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int ret = inflate(&zs, Z_FINISH);
    inflateEnd(&zs);

    if (ret != Z_STREAM_END || zs.total_out != out.size()) {
        throw LoadError("Voice bank entry '" + entry.name + "' failed to inflate");
    }
    return out;
}

/**
 * Parse a float32 .npy array into row-major data. Returns the row count
 * for a trailing dimension of STYLE_DIM.
 */
size_t parseNpy(const std::string& name, const std::vector<uint8_t>& npy, std::vector<float>& out) {
    static const char MAGIC[] = "\x93NUMPY";
    if (npy.size() < 10 || std::memcmp(npy.data(), MAGIC, 6) != 0) {
        throw LoadError("Voice '" + name + "' is not a .npy array");
    }

    uint8_t major = npy[6];
    size_t header_len;
    size_t header_start;
    if (major == 1) {
        header_len = npy[8] | (npy[9] << 8);
        header_start = 10;
    } else {
        if (npy.size() < 12) throw LoadError("Voice '" + name + "' header is truncated");
        header_len = static_cast<size_t>(npy[8]) | (static_cast<size_t>(npy[9]) << 8) |
                     (static_cast<size_t>(npy[10]) << 16) | (static_cast<size_t>(npy[11]) << 24);
        header_start = 12;
    }
    if (header_start + header_len > npy.size()) {
        throw LoadError("Voice '" + name + "' header is truncated");
    }

    std::string header(reinterpret_cast<const char*>(npy.data() + header_start), header_len);

    auto valueAfter = [&](const std::string& key) -> std::string {
        size_t k = header.find("'" + key + "'");
        if (k == std::string::npos) {
            throw LoadError("Voice '" + name + "' header has no " + key);
        }
        size_t colon = header.find(':', k);
        if (colon == std::string::npos) {
            throw LoadError("Voice '" + name + "' header is malformed");
        }
        return header.substr(colon + 1);
    };

    std::string descr = valueAfter("descr");
    size_t q1 = descr.find('\'');
    size_t q2 = descr.find('\'', q1 + 1);
    if (q1 == std::string::npos || q2 == std::string::npos ||
        descr.substr(q1 + 1, q2 - q1 - 1) != "<f4") {
        throw LoadError("Voice '" + name + "' is not little-endian float32");
    }

    std::string fortran = valueAfter("fortran_order");
    fortran.erase(0, fortran.find_first_not_of(' '));
    if (fortran.rfind("False", 0) != 0) {
        throw LoadError("Voice '" + name + "' uses Fortran order");
    }

    std::string shape_text = valueAfter("shape");
    size_t open = shape_text.find('(');
    size_t close = shape_text.find(')', open);
    if (open == std::string::npos || close == std::string::npos) {
        throw LoadError("Voice '" + name + "' header has no shape tuple");
    }

    std::vector<size_t> shape;
    std::string dims = shape_text.substr(open + 1, close - open - 1);
    size_t i = 0;
    while (i < dims.size()) {
        if (std::isdigit(static_cast<unsigned char>(dims[i]))) {
            size_t value = 0;
            while (i < dims.size() && std::isdigit(static_cast<unsigned char>(dims[i]))) {
                value = value * 10 + static_cast<size_t>(dims[i] - '0');
                ++i;
            }
            shape.push_back(value);
        } else {
            ++i;
        }
    }

    if (shape.empty() || shape.back() != VoiceBank::STYLE_DIM) {
        throw LoadError("Voice '" + name + "' does not end in a 256-wide style dimension");
    }

    size_t count = 1;
    for (size_t d : shape) count *= d;

    size_t data_offset = header_start + header_len;
    if (npy.size() - data_offset < count * sizeof(float)) {
        throw LoadError("Voice '" + name + "' data is truncated");
    }

    out.resize(count);
    std::memcpy(out.data(), npy.data() + data_offset, count * sizeof(float));
    return count / VoiceBank::STYLE_DIM;
}

} // anonymous namespace

VoiceBank VoiceBank::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw LoadError("Voice bank not found or not a file: " + path);
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.good()) {
        throw LoadError("Cannot open voice bank: " + path);
    }

    std::streamoff size = file.tellg();
    if (size < 0) {
        throw LoadError("Cannot size voice bank: " + path);
    }
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(bytes.data()), size)) {
        throw LoadError("Failed to read voice bank: " + path);
    }

    return fromBytes(bytes);
}

VoiceBank VoiceBank::fromBytes(const std::vector<uint8_t>& archive) {
    ByteReader zip(archive);
    VoiceBank bank;

    for (const auto& entry : readCentralDirectory(zip)) {
        const std::string suffix = ".npy";
        if (entry.name.size() <= suffix.size() ||
            entry.name.compare(entry.name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::string voice = entry.name.substr(0, entry.name.size() - suffix.size());

        std::vector<float> data;
        size_t rows = parseNpy(voice, extractEntry(zip, entry), data);
        if (rows == 0) {
            throw LoadError("Voice '" + voice + "' has no style rows");
        }
        bank.voices_[voice] = std::move(data);
    }

    if (bank.voices_.empty()) {
        throw LoadError("Voice bank contains no voices");
    }
    return bank;
}

std::set<std::string> VoiceBank::names() const {
    std::set<std::string> result;
    for (const auto& [name, data] : voices_) {
        result.insert(name);
    }
    return result;
}

bool VoiceBank::contains(const std::string& voice) const {
    return voices_.count(voice) > 0;
}

size_t VoiceBank::rows(const std::string& voice) const {
    auto it = voices_.find(voice);
    return it == voices_.end() ? 0 : it->second.size() / STYLE_DIM;
}

std::vector<float> VoiceBank::style(const std::string& voice, size_t token_count) const {
    auto it = voices_.find(voice);
    if (it == voices_.end()) {
        throw SynthesisError("Unknown voice: " + voice);
    }
    size_t row_count = it->second.size() / STYLE_DIM;
    size_t row = std::min(token_count, row_count - 1);
    auto begin = it->second.begin() + static_cast<std::ptrdiff_t>(row * STYLE_DIM);
    return std::vector<float>(begin, begin + STYLE_DIM);
}

} // namespace kokorod::tts
