/**
 * SynthesisEngine.hpp - Text-to-speech capability used by the daemon
 *
 * The daemon only depends on this interface, so tests can inject an
 * in-memory engine instead of loading a real model.
 */

#pragma once

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace kokorod::tts {

/**
 * Model or voice bank could not be loaded. Fatal at startup.
 */
class LoadError : public std::runtime_error {
public:
    explicit LoadError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * A single synthesis request failed. The engine stays usable.
 */
class SynthesisError : public std::runtime_error {
public:
    explicit SynthesisError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Mono float samples in [-1, 1] and their sample rate
 */
struct SynthesisResult {
    std::vector<float> samples;
    int sample_rate = 24000;

    float durationSeconds() const {
        return sample_rate > 0 ? static_cast<float>(samples.size()) / sample_rate : 0.0f;
    }
};

class SynthesisEngine {
public:
    virtual ~SynthesisEngine() = default;

    /// Voice identifiers accepted by synthesize()
    virtual std::set<std::string> listVoices() const = 0;

    /**
     * @param text  UTF-8 text
     * @param voice identifier from listVoices()
     * @param speed tempo multiplier (1.0 = normal)
     * @throws SynthesisError
     */
    virtual SynthesisResult synthesize(const std::string& text,
                                       const std::string& voice,
                                       float speed) = 0;
};

} // namespace kokorod::tts
