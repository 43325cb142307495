/**
 * KokoroEngine.hpp - Kokoro v1.0 ONNX synthesis engine
 *
 * text -> espeak-ng phonemes -> token ids -> ONNX Runtime -> 24kHz audio.
 */

#pragma once

#include "kokorod/tts/SynthesisEngine.hpp"

#include <memory>
#include <string>

namespace kokorod::tts {

struct KokoroOptions {
    std::string vocab_path;         // Empty = built-in vocabulary
    std::string espeak_data_path;   // Empty = espeak-ng default
    std::string default_language = "en-us";
    int intra_op_threads = 0;
};

class KokoroEngine : public SynthesisEngine {
public:
    static constexpr int SAMPLE_RATE = 24000;
    static constexpr size_t MAX_PHONEME_TOKENS = 510;
    static constexpr float MIN_SPEED = 0.5f;
    static constexpr float MAX_SPEED = 2.0f;

    /**
     * @param model_path  kokoro-v1.0.onnx
     * @param voices_path voices.bin
     * @throws LoadError
     */
    KokoroEngine(const std::string& model_path,
                 const std::string& voices_path,
                 const KokoroOptions& options = {});
    ~KokoroEngine() override;

    KokoroEngine(const KokoroEngine&) = delete;
    KokoroEngine& operator=(const KokoroEngine&) = delete;

    std::set<std::string> listVoices() const override;

    SynthesisResult synthesize(const std::string& text,
                               const std::string& voice,
                               float speed) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kokorod::tts
