/**
 * KokoroEngine.cpp - Kokoro v1.0 inference with ONNX Runtime
 *
 * Model and voice bank are loaded once and stay resident. Long inputs are
 * split into batches of at most MAX_PHONEME_TOKENS and the audio of each
 * batch is concatenated.
 */

#include "kokorod/tts/KokoroEngine.hpp"
#include "kokorod/tts/Phonemizer.hpp"
#include "kokorod/tts/Tokenizer.hpp"
#include "kokorod/tts/VoiceBank.hpp"
#include "kokorod/util/Logger.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <sstream>

#include <onnxruntime_cxx_api.h>

namespace kokorod::tts {

namespace {

constexpr int64_t PAD_TOKEN = 0;

} // anonymous namespace

struct KokoroEngine::Impl {
    KokoroOptions options;
    VoiceBank voices;
    Tokenizer tokenizer;
    std::unique_ptr<Phonemizer> phonemizer;

    Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "kokorod"};
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;

    // Older exports name the token input "input_ids" and take an int32 speed
    bool legacy_inputs = false;
    std::string output_name = "audio";

    Impl(const std::string& model_path, const std::string& voices_path, const KokoroOptions& opts)
        : options(opts)
        , voices(VoiceBank::load(voices_path)) {

        log::info("KokoroEngine", "Voice bank loaded: " + voices_path +
                  " (" + std::to_string(voices.size()) + " voices)");

        if (!options.vocab_path.empty()) {
            tokenizer = Tokenizer::fromConfigFile(options.vocab_path);
            log::info("KokoroEngine", "Vocabulary loaded: " + options.vocab_path);
        }

        phonemizer = std::make_unique<Phonemizer>(options.espeak_data_path);

        if (options.intra_op_threads > 0) {
            session_options.SetIntraOpNumThreads(options.intra_op_threads);
        }
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        auto start = std::chrono::steady_clock::now();
        try {
            session = std::make_unique<Ort::Session>(env, model_path.c_str(), session_options);
        } catch (const Ort::Exception& e) {
            throw LoadError("Failed to load model " + model_path + ": " + e.what());
        }
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);

        try {
            inspectModel();
        } catch (const Ort::Exception& e) {
            throw LoadError("Failed to inspect model " + model_path + ": " + e.what());
        }

        std::ostringstream msg;
        msg << "Model loaded: " << model_path << " in " << elapsed.count() << "s"
            << (legacy_inputs ? " (input_ids layout)" : "");
        log::info("KokoroEngine", msg.str());
    }

    void inspectModel() {
        Ort::AllocatorWithDefaultOptions allocator;

        for (size_t i = 0; i < session->GetInputCount(); ++i) {
            auto name = session->GetInputNameAllocated(i, allocator);
            if (std::string(name.get()) == "input_ids") {
                legacy_inputs = true;
            }
        }

        if (session->GetOutputCount() < 1) {
            throw LoadError("Model has no outputs");
        }
        output_name = session->GetOutputNameAllocated(0, allocator).get();
    }

    std::vector<float> runBatch(const std::vector<int64_t>& batch,
                                const std::string& voice,
                                float speed) {
        std::vector<float> style = voices.style(voice, batch.size());

        std::vector<int64_t> tokens;
        tokens.reserve(batch.size() + 2);
        tokens.push_back(PAD_TOKEN);
        tokens.insert(tokens.end(), batch.begin(), batch.end());
        tokens.push_back(PAD_TOKEN);

        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        std::array<int64_t, 2> tokens_shape{1, static_cast<int64_t>(tokens.size())};
        std::array<int64_t, 2> style_shape{1, static_cast<int64_t>(VoiceBank::STYLE_DIM)};
        std::array<int64_t, 1> speed_shape{1};

        // Must outlive Run()
        std::array<float, 1> speed_f{speed};
        std::array<int32_t, 1> speed_i{static_cast<int32_t>(std::lround(speed))};

        std::vector<Ort::Value> inputs;
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(
            memory_info, tokens.data(), tokens.size(), tokens_shape.data(), tokens_shape.size()));
        inputs.push_back(Ort::Value::CreateTensor<float>(
            memory_info, style.data(), style.size(), style_shape.data(), style_shape.size()));
        if (legacy_inputs) {
            inputs.push_back(Ort::Value::CreateTensor<int32_t>(
                memory_info, speed_i.data(), speed_i.size(), speed_shape.data(), speed_shape.size()));
        } else {
            inputs.push_back(Ort::Value::CreateTensor<float>(
                memory_info, speed_f.data(), speed_f.size(), speed_shape.data(), speed_shape.size()));
        }

        std::array<const char*, 3> input_names = {
            legacy_inputs ? "input_ids" : "tokens", "style", "speed"};
        std::array<const char*, 1> output_names = {output_name.c_str()};

        std::vector<Ort::Value> outputs;
        try {
            outputs = session->Run(Ort::RunOptions{nullptr},
                                   input_names.data(), inputs.data(), inputs.size(),
                                   output_names.data(), output_names.size());
        } catch (const Ort::Exception& e) {
            throw SynthesisError(std::string("Inference failed: ") + e.what());
        }

        if (outputs.empty() || !outputs.front().IsTensor()) {
            throw SynthesisError("Model returned no audio tensor");
        }

        const float* audio = outputs.front().GetTensorData<float>();
        size_t count = outputs.front().GetTensorTypeAndShapeInfo().GetElementCount();
        return std::vector<float>(audio, audio + count);
    }

    SynthesisResult synthesize(const std::string& text, const std::string& voice, float speed) {
        if (!voices.contains(voice)) {
            throw SynthesisError("Unknown voice: " + voice);
        }
        if (!std::isfinite(speed) || speed < MIN_SPEED || speed > MAX_SPEED) {
            std::ostringstream msg;
            msg << "Speed " << speed << " outside [" << MIN_SPEED << ", " << MAX_SPEED << "]";
            throw SynthesisError(msg.str());
        }

        std::string language = Phonemizer::languageForVoice(voice, options.default_language);
        std::string phonemes = phonemizer->phonemize(text, language);
        std::vector<int64_t> ids = tokenizer.encode(phonemes);

        if (ids.empty()) {
            throw SynthesisError("No phonemes produced for text");
        }

        SynthesisResult result;
        result.sample_rate = SAMPLE_RATE;

        auto start = std::chrono::steady_clock::now();
        for (size_t offset = 0; offset < ids.size(); offset += MAX_PHONEME_TOKENS) {
            size_t end = std::min(ids.size(), offset + MAX_PHONEME_TOKENS);
            std::vector<int64_t> batch(ids.begin() + static_cast<std::ptrdiff_t>(offset),
                                       ids.begin() + static_cast<std::ptrdiff_t>(end));
            std::vector<float> audio = runBatch(batch, voice, speed);
            result.samples.insert(result.samples.end(), audio.begin(), audio.end());
        }
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);

        std::ostringstream msg;
        msg << ids.size() << " tokens -> " << result.durationSeconds() << "s audio in "
            << elapsed.count() << "s (" << language << ")";
        log::debug("KokoroEngine", msg.str());

        return result;
    }
};

KokoroEngine::KokoroEngine(const std::string& model_path,
                           const std::string& voices_path,
                           const KokoroOptions& options)
    : impl_(std::make_unique<Impl>(model_path, voices_path, options)) {
}

KokoroEngine::~KokoroEngine() = default;

std::set<std::string> KokoroEngine::listVoices() const {
    return impl_->voices.names();
}

SynthesisResult KokoroEngine::synthesize(const std::string& text,
                                         const std::string& voice,
                                         float speed) {
    return impl_->synthesize(text, voice, speed);
}

} // namespace kokorod::tts
