/**
 * VoiceBank.hpp - Kokoro style vectors loaded from voices.bin (.npz)
 */

#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace kokorod::tts {

class VoiceBank {
public:
    static constexpr size_t STYLE_DIM = 256;

    /**
     * Parse a NumPy .npz archive whose entries are float32 arrays of
     * shape (N, 1, 256) or (N, 256).
     * @throws LoadError
     */
    static VoiceBank load(const std::string& path);

    /// Same as load() but from bytes already in memory
    static VoiceBank fromBytes(const std::vector<uint8_t>& archive);

    std::set<std::string> names() const;
    bool contains(const std::string& voice) const;
    size_t size() const { return voices_.size(); }

    /// Number of style rows stored for a voice (0 if unknown)
    size_t rows(const std::string& voice) const;

    /**
     * Style vector for an utterance of `token_count` tokens. Counts past
     * the last row use the last row.
     * @throws SynthesisError if the voice is unknown
     */
    std::vector<float> style(const std::string& voice, size_t token_count) const;

private:
    // voice -> row-major [rows x STYLE_DIM]
    std::map<std::string, std::vector<float>> voices_;
};

} // namespace kokorod::tts
