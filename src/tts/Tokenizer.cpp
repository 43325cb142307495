/**
 * Tokenizer.cpp - Kokoro phoneme vocabulary
 */

#include "kokorod/tts/Tokenizer.hpp"
#include "kokorod/tts/SynthesisEngine.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kokorod::tts {

namespace {

struct VocabEntry {
    const char* symbol;
    int64_t id;
};

// Kokoro v1.0 (config.json "vocab")
const VocabEntry DEFAULT_VOCAB[] = {
    {";", 1}, {":", 2}, {",", 3}, {".", 4}, {"!", 5}, {"?", 6},
    {"—", 9}, {"…", 10}, {"\"", 11}, {"(", 12}, {")", 13},
    {"“", 14}, {"”", 15}, {" ", 16}, {"\u0303", 17},
    {"ʣ", 18}, {"ʥ", 19}, {"ʦ", 20}, {"ʨ", 21},
    {"ᵝ", 22}, {"ꭧ", 23},
    {"A", 24}, {"I", 25}, {"O", 31}, {"Q", 33}, {"S", 35}, {"T", 36},
    {"W", 39}, {"Y", 41}, {"ᵊ", 42},
    {"a", 43}, {"b", 44}, {"c", 45}, {"d", 46}, {"e", 47}, {"f", 48},
    {"h", 50}, {"i", 51}, {"j", 52}, {"k", 53}, {"l", 54}, {"m", 55},
    {"n", 56}, {"o", 57}, {"p", 58}, {"q", 59}, {"r", 60}, {"s", 61},
    {"t", 62}, {"u", 63}, {"v", 64}, {"w", 65}, {"x", 66}, {"y", 67},
    {"z", 68},
    {"ɑ", 69}, {"ɐ", 70}, {"ɒ", 71}, {"æ", 72},
    {"β", 75}, {"ɔ", 76}, {"ɕ", 77}, {"ç", 78},
    {"ɖ", 80}, {"ð", 81}, {"ʤ", 82}, {"ə", 83},
    {"ɚ", 85}, {"ɛ", 86}, {"ɜ", 87}, {"ɟ", 90},
    {"ɡ", 92}, {"ɥ", 99}, {"ɨ", 101}, {"ɪ", 102},
    {"ʝ", 103}, {"ɯ", 110}, {"ɰ", 111}, {"ŋ", 112},
    {"ɳ", 113}, {"ɲ", 114}, {"ɴ", 115}, {"ø", 116},
    {"ɸ", 118}, {"θ", 119}, {"œ", 120}, {"ɹ", 123},
    {"ɾ", 125}, {"ɻ", 126}, {"ʁ", 128}, {"ɽ", 129},
    {"ʂ", 130}, {"ʃ", 131}, {"ʈ", 132}, {"ʧ", 133},
    {"ʊ", 135}, {"ʋ", 136}, {"ʌ", 138}, {"ɣ", 139},
    {"ɤ", 140}, {"χ", 142}, {"ʎ", 143}, {"ʒ", 147},
    {"ʔ", 148}, {"ˈ", 156}, {"ˌ", 157}, {"ː", 158},
    {"ʰ", 162}, {"ʲ", 164}, {"↓", 169}, {"→", 171},
    {"↗", 172}, {"↘", 173}, {"ᵻ", 177},
};

} // anonymous namespace

std::u32string decodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp;
        size_t extra;

        if (c < 0x80) {
            cp = c;
            extra = 0;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            ++i;  // Stray continuation or invalid lead byte
            continue;
        }

        if (i + extra >= text.size()) {
            break;  // Truncated sequence at the end
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (valid) {
            out.push_back(cp);
            i += extra + 1;
        } else {
            ++i;
        }
    }

    return out;
}

Tokenizer::Tokenizer() {
    for (const auto& entry : DEFAULT_VOCAB) {
        std::u32string symbol = decodeUtf8(entry.symbol);
        if (symbol.size() == 1) {
            vocab_[symbol[0]] = entry.id;
        }
    }
}

Tokenizer Tokenizer::fromConfigJson(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw LoadError(std::string("Vocabulary config is not valid JSON: ") + e.what());
    }

    if (!root.is_object() || !root.contains("vocab") || !root["vocab"].is_object()) {
        throw LoadError("Vocabulary config has no \"vocab\" object");
    }

    Tokenizer tokenizer;
    tokenizer.vocab_.clear();

    for (auto& [symbol, id] : root["vocab"].items()) {
        std::u32string cp = decodeUtf8(symbol);
        if (cp.size() != 1 || !id.is_number_integer()) {
            throw LoadError("Invalid vocabulary entry: " + symbol);
        }
        tokenizer.vocab_[cp[0]] = id.get<int64_t>();
    }

    if (tokenizer.vocab_.empty()) {
        throw LoadError("Vocabulary is empty");
    }
    return tokenizer;
}

Tokenizer Tokenizer::fromConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw LoadError("Vocabulary config not found: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromConfigJson(buffer.str());
}

std::vector<int64_t> Tokenizer::encode(const std::string& phonemes) const {
    std::vector<int64_t> ids;
    for (char32_t cp : decodeUtf8(phonemes)) {
        auto it = vocab_.find(cp);
        if (it != vocab_.end()) {
            ids.push_back(it->second);
        }
    }
    return ids;
}

} // namespace kokorod::tts
