/**
 * test_voice_bank.cpp - voices.bin (.npz) parsing
 *
 * Archives are assembled in memory: stored and deflated members, the way
 * numpy.savez and numpy.savez_compressed write them.
 */

#include "kokorod/tts/SynthesisEngine.hpp"
#include "kokorod/tts/VoiceBank.hpp"
#include <cassert>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>
#include <zlib.h>

using namespace kokorod::tts;

namespace {

using Bytes = std::vector<uint8_t>;

void put16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put32(Bytes& out, uint32_t v) {
    put16(out, static_cast<uint16_t>(v));
    put16(out, static_cast<uint16_t>(v >> 16));
}

// .npy v1.0 with the given dtype/shape; data is rows * 256 floats where row r holds r + col/1000
Bytes makeNpy(const std::string& descr, const std::string& shape, size_t rows, bool fortran = false) {
    std::string header = "{'descr': '" + descr + "', 'fortran_order': " +
                         (fortran ? "True" : "False") + ", 'shape': " + shape + ", }";
    size_t total = 10 + header.size() + 1;
    header.append((64 - total % 64) % 64, ' ');
    header.push_back('\n');

    Bytes npy = {0x93, 'N', 'U', 'M', 'P', 'Y', 1, 0};
    put16(npy, static_cast<uint16_t>(header.size()));
    npy.insert(npy.end(), header.begin(), header.end());

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < VoiceBank::STYLE_DIM; ++c) {
            float value = static_cast<float>(r) + static_cast<float>(c) / 1000.0f;
            uint8_t raw[4];
            std::memcpy(raw, &value, 4);
            npy.insert(npy.end(), raw, raw + 4);
        }
    }
    return npy;
}

Bytes deflateRaw(const Bytes& input) {
    z_stream zs{};
    int rc = deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    assert(rc == Z_OK);

    Bytes out(deflateBound(&zs, static_cast<uLong>(input.size())));
    zs.next_in = const_cast<Bytef*>(input.data());
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    rc = deflate(&zs, Z_FINISH);
    assert(rc == Z_STREAM_END);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

struct Member {
    std::string name;
    Bytes data;
    bool compress = false;
};

Bytes makeZip(const std::vector<Member>& members) {
    Bytes zip;
    Bytes central;

    for (const auto& member : members) {
        Bytes payload = member.compress ? deflateRaw(member.data) : member.data;
        uint32_t crc = static_cast<uint32_t>(crc32(0L, member.data.data(), static_cast<uInt>(member.data.size())));
        uint16_t method = member.compress ? 8 : 0;
        uint32_t offset = static_cast<uint32_t>(zip.size());

        put32(zip, 0x04034b50);
        put16(zip, 20);
        put16(zip, 0);
        put16(zip, method);
        put16(zip, 0);
        put16(zip, 0);
        put32(zip, crc);
        put32(zip, static_cast<uint32_t>(payload.size()));
        put32(zip, static_cast<uint32_t>(member.data.size()));
        put16(zip, static_cast<uint16_t>(member.name.size()));
        put16(zip, 0);
        zip.insert(zip.end(), member.name.begin(), member.name.end());
        zip.insert(zip.end(), payload.begin(), payload.end());

        put32(central, 0x02014b50);
        put16(central, 20);
        put16(central, 20);
        put16(central, 0);
        put16(central, method);
        put16(central, 0);
        put16(central, 0);
        put32(central, crc);
        put32(central, static_cast<uint32_t>(payload.size()));
        put32(central, static_cast<uint32_t>(member.data.size()));
        put16(central, static_cast<uint16_t>(member.name.size()));
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put32(central, 0);
        put32(central, offset);
        central.insert(central.end(), member.name.begin(), member.name.end());
    }

    uint32_t cd_offset = static_cast<uint32_t>(zip.size());
    zip.insert(zip.end(), central.begin(), central.end());

    put32(zip, 0x06054b50);
    put16(zip, 0);
    put16(zip, 0);
    put16(zip, static_cast<uint16_t>(members.size()));
    put16(zip, static_cast<uint16_t>(members.size()));
    put32(zip, static_cast<uint32_t>(central.size()));
    put32(zip, cd_offset);
    put16(zip, 0);
    return zip;
}

template <typename Fn>
bool throwsLoadError(Fn fn) {
    try {
        fn();
    } catch (const LoadError&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_stored_and_deflated() {
    Bytes zip = makeZip({
        {"af_bella.npy", makeNpy("<f4", "(4, 1, 256)", 4), false},
        {"am_adam.npy", makeNpy("<f4", "(3, 256)", 3), true},
    });

    VoiceBank bank = VoiceBank::fromBytes(zip);
    assert(bank.size() == 2);
    assert((bank.names() == std::set<std::string>{"af_bella", "am_adam"}));
    assert(bank.contains("af_bella"));
    assert(!bank.contains("af_sky"));
    assert(bank.rows("af_bella") == 4);
    assert(bank.rows("am_adam") == 3);
    assert(bank.rows("af_sky") == 0);

    std::cout << "[PASS] test_stored_and_deflated" << std::endl;
}

void test_style_rows() {
    Bytes zip = makeZip({{"af_bella.npy", makeNpy("<f4", "(4, 1, 256)", 4), true}});
    VoiceBank bank = VoiceBank::fromBytes(zip);

    std::vector<float> row2 = bank.style("af_bella", 2);
    assert(row2.size() == VoiceBank::STYLE_DIM);
    assert(row2[0] == 2.0f);
    assert(row2[255] == 2.0f + 255.0f / 1000.0f);

    // Past the end clamps to the last row
    std::vector<float> clamped = bank.style("af_bella", 500);
    assert(clamped[0] == 3.0f);

    bool threw = false;
    try {
        bank.style("zz_nobody", 1);
    } catch (const SynthesisError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_style_rows" << std::endl;
}

void test_ignores_other_members() {
    Bytes readme = {'h', 'i'};
    Bytes zip = makeZip({
        {"README.txt", readme, false},
        {"bf_emma.npy", makeNpy("<f4", "(2, 256)", 2), false},
    });
    VoiceBank bank = VoiceBank::fromBytes(zip);
    assert((bank.names() == std::set<std::string>{"bf_emma"}));

    std::cout << "[PASS] test_ignores_other_members" << std::endl;
}

void test_rejects_bad_arrays() {
    assert(throwsLoadError([] {
        VoiceBank::fromBytes(makeZip({{"a.npy", makeNpy("<f8", "(2, 256)", 4), false}}));
    }));
    assert(throwsLoadError([] {
        VoiceBank::fromBytes(makeZip({{"a.npy", makeNpy("<f4", "(2, 256)", 2, true), false}}));
    }));
    assert(throwsLoadError([] {
        VoiceBank::fromBytes(makeZip({{"a.npy", makeNpy("<f4", "(2, 128)", 1), false}}));
    }));
    assert(throwsLoadError([] {
        // Header promises more rows than the data holds
        VoiceBank::fromBytes(makeZip({{"a.npy", makeNpy("<f4", "(8, 256)", 2), false}}));
    }));
    assert(throwsLoadError([] {
        VoiceBank::fromBytes(makeZip({{"a.npy", Bytes{'n', 'o', 't', ' ', 'n', 'p', 'y', '!', '!', '!'}, false}}));
    }));

    std::cout << "[PASS] test_rejects_bad_arrays" << std::endl;
}

void test_rejects_bad_archives() {
    assert(throwsLoadError([] { VoiceBank::fromBytes(Bytes{}); }));
    assert(throwsLoadError([] { VoiceBank::fromBytes(Bytes(100, 0x42)); }));
    assert(throwsLoadError([] { VoiceBank::fromBytes(makeZip({})); }));
    assert(throwsLoadError([] { VoiceBank::load("/nonexistent/voices.bin"); }));
    assert(throwsLoadError([] { VoiceBank::load("/tmp"); }));

    // Truncated archive: central directory points past the end
    Bytes zip = makeZip({{"af_bella.npy", makeNpy("<f4", "(2, 256)", 2), false}});
    Bytes truncated(zip.begin() + 100, zip.end());
    assert(throwsLoadError([&] { VoiceBank::fromBytes(truncated); }));

    std::cout << "[PASS] test_rejects_bad_archives" << std::endl;
}

void test_load_from_file() {
    std::string path = "/tmp/kokorod_voices_" + std::to_string(::getpid()) + ".bin";
    Bytes zip = makeZip({{"af_sarah.npy", makeNpy("<f4", "(5, 1, 256)", 5), true}});
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(zip.data()), static_cast<std::streamsize>(zip.size()));
    }

    VoiceBank bank = VoiceBank::load(path);
    assert(bank.contains("af_sarah"));
    assert(bank.rows("af_sarah") == 5);
    ::unlink(path.c_str());

    std::cout << "[PASS] test_load_from_file" << std::endl;
}

int main() {
    std::cout << "=== VoiceBank Tests ===" << std::endl;

    test_stored_and_deflated();
    test_style_rows();
    test_ignores_other_members();
    test_rejects_bad_arrays();
    test_rejects_bad_archives();
    test_load_from_file();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
