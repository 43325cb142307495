/**
 * Tokenizer.hpp - Phoneme string -> Kokoro token ids
 */

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace kokorod::tts {

class Tokenizer {
public:
    /// Built-in Kokoro v1.0 vocabulary
    Tokenizer();

    /**
     * Vocabulary from a Kokoro config.json ({"vocab": {"a": 43, ...}})
     * @throws LoadError
     */
    static Tokenizer fromConfigFile(const std::string& path);
    static Tokenizer fromConfigJson(const std::string& json_text);

    /// Ids for each known code point; unknown code points are dropped
    std::vector<int64_t> encode(const std::string& phonemes) const;

    size_t vocabSize() const { return vocab_.size(); }

private:
    std::unordered_map<char32_t, int64_t> vocab_;
};

/// Decode UTF-8 into code points; invalid bytes are skipped
std::u32string decodeUtf8(const std::string& text);

} // namespace kokorod::tts
