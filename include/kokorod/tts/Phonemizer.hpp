/**
 * Phonemizer.hpp - espeak-ng IPA phonemization
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace kokorod::tts {

struct Clause {
    std::string text;
    char punctuation = '\0';   // '\0' for the trailing clause
};

class Phonemizer {
public:
    /**
     * @param data_path espeak-ng data directory (empty = library default)
     * @throws LoadError if espeak-ng cannot be initialized
     */
    explicit Phonemizer(const std::string& data_path = "");
    ~Phonemizer();

    Phonemizer(const Phonemizer&) = delete;
    Phonemizer& operator=(const Phonemizer&) = delete;

    /**
     * Convert text to an IPA phoneme string (UTF-8), clauses joined by
     * their punctuation.
     * @throws SynthesisError if the language is not available
     */
    std::string phonemize(const std::string& text, const std::string& language);

    /**
     * Split at . , ; : ! ? followed by whitespace or the end of the text,
     * so "3.14" and "10:30" stay inside their clause.
     */
    static std::vector<Clause> splitClauses(const std::string& text);

    /**
     * espeak language for a Kokoro voice, chosen from the voice's first
     * letter ("af_bella" -> "en-us", "bf_emma" -> "en-gb", ...)
     */
    static std::string languageForVoice(const std::string& voice,
                                        const std::string& fallback = "en-us");

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kokorod::tts
