/**
 * Phonemizer.cpp - espeak-ng text -> IPA
 *
 * espeak-ng keeps global state, so all calls are serialized and the
 * library is initialized once per process.
 */

#include "kokorod/tts/Phonemizer.hpp"
#include "kokorod/tts/SynthesisEngine.hpp"
#include "kokorod/util/Logger.hpp"

#include <cctype>
#include <map>
#include <mutex>
#include <regex>

#include <espeak-ng/speak_lib.h>

namespace kokorod::tts {

namespace {

std::mutex g_espeak_mutex;
int g_espeak_users = 0;

// Punctuation kept between clauses (all of it is in the Kokoro vocabulary)
bool isClausePunctuation(char c) {
    return c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?';
}

} // anonymous namespace

struct Phonemizer::Impl {
    std::string current_language;
    std::regex language_flags{R"(\([a-z]{2,3}(-[a-z0-9]+)?\))"};

    explicit Impl(const std::string& data_path) {
        std::lock_guard<std::mutex> lock(g_espeak_mutex);
        if (g_espeak_users == 0) {
            int rate = espeak_Initialize(AUDIO_OUTPUT_SYNCHRONOUS, 0,
                                         data_path.empty() ? nullptr : data_path.c_str(),
                                         espeakINITIALIZE_DONT_EXIT);
            if (rate < 0) {
                throw LoadError("Failed to initialize espeak-ng" +
                                (data_path.empty() ? std::string() : " (data: " + data_path + ")"));
            }
            log::debug("Phonemizer", "espeak-ng initialized");
        }
        ++g_espeak_users;
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(g_espeak_mutex);
        if (--g_espeak_users == 0) {
            espeak_Terminate();
        }
    }

    // Caller holds g_espeak_mutex
    void selectLanguage(const std::string& language) {
        if (language == current_language) return;
        if (espeak_SetVoiceByName(language.c_str()) != EE_OK) {
            throw SynthesisError("espeak-ng has no voice for language '" + language + "'");
        }
        current_language = language;
    }

    // Caller holds g_espeak_mutex
    std::string phonemizeClause(const std::string& clause) {
        std::string result;
        const void* text_ptr = clause.c_str();

        while (text_ptr != nullptr) {
            const char* phonemes = espeak_TextToPhonemes(&text_ptr, espeakCHARS_UTF8, espeakPHONEMES_IPA);
            if (phonemes == nullptr) break;
            if (!result.empty()) result += ' ';
            result += phonemes;
        }

        return std::regex_replace(result, language_flags, "");
    }
};

Phonemizer::Phonemizer(const std::string& data_path)
    : impl_(std::make_unique<Impl>(data_path)) {
}

Phonemizer::~Phonemizer() = default;

std::string Phonemizer::phonemize(const std::string& text, const std::string& language) {
    std::lock_guard<std::mutex> lock(g_espeak_mutex);
    impl_->selectLanguage(language);

    // espeak drops punctuation, so phonemize clause by clause and put it back
    std::string result;
    for (const Clause& clause : splitClauses(text)) {
        bool has_text = clause.text.find_first_not_of(" \t\r\n") != std::string::npos;
        if (has_text) {
            std::string phonemes = impl_->phonemizeClause(clause.text);
            if (!phonemes.empty()) {
                if (!result.empty() && result.back() != ' ') result += ' ';
                result += phonemes;
            }
        }
        if (clause.punctuation != '\0' && !result.empty()) {
            result += clause.punctuation;
        }
    }

    return result;
}

std::vector<Clause> Phonemizer::splitClauses(const std::string& text) {
    std::vector<Clause> clauses;
    Clause current;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        bool at_break = i + 1 == text.size() ||
                        std::isspace(static_cast<unsigned char>(text[i + 1]));
        if (isClausePunctuation(c) && at_break) {
            current.punctuation = c;
            clauses.push_back(std::move(current));
            current = Clause();
        } else {
            current.text += c;
        }
    }
    if (!current.text.empty()) {
        clauses.push_back(std::move(current));
    }
    return clauses;
}

std::string Phonemizer::languageForVoice(const std::string& voice, const std::string& fallback) {
    static const std::map<char, std::string> LANGUAGES = {
        {'a', "en-us"},
        {'b', "en-gb"},
        {'e', "es"},
        {'f', "fr-fr"},
        {'h', "hi"},
        {'i', "it"},
        {'j', "ja"},
        {'p', "pt-br"},
        {'z', "cmn"},
    };

    if (voice.size() < 3 || voice[2] != '_') {
        return fallback;
    }
    auto it = LANGUAGES.find(voice[0]);
    return it != LANGUAGES.end() ? it->second : fallback;
}

} // namespace kokorod::tts
