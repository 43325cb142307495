/**
 * test_daemon.cpp - Command loop against a scripted engine and backend
 *
 * No model or audio device is needed: the engine returns a short tone and
 * the backend only checks the WAV it is handed.
 */

#include "kokorod/Daemon.hpp"
#include "kokorod/audio/WavFile.hpp"
#include "kokorod/util/Logger.hpp"
#include <cassert>
#include <chrono>
#include <cmath>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <unistd.h>

using namespace kokorod;

namespace {

struct SynthesisCall {
    std::string text;
    std::string voice;
    float speed;
};

class ScriptedEngine : public tts::SynthesisEngine {
public:
    std::set<std::string> voices = {"af_bella", "af_sarah", "am_adam"};
    std::vector<SynthesisCall> calls;
    bool fail = false;

    std::set<std::string> listVoices() const override { return voices; }

    tts::SynthesisResult synthesize(const std::string& text,
                                    const std::string& voice,
                                    float speed) override {
        calls.push_back({text, voice, speed});
        if (fail) {
            throw tts::SynthesisError("scripted failure");
        }
        tts::SynthesisResult result;
        result.sample_rate = 24000;
        result.samples.assign(2400, 0.25f);
        return result;
    }
};

struct PlaybackLog {
    int plays = 0;
    std::vector<std::string> paths;
};

class RecordingBackend : public audio::AudioBackend {
public:
    RecordingBackend(std::shared_ptr<PlaybackLog> log, audio::PlaybackOutcome outcome)
        : log_(std::move(log)), outcome_(outcome) {}

    std::string name() const override { return "recording"; }

    audio::PlaybackOutcome play(const std::string& wav_path, std::chrono::milliseconds) override {
        ++log_->plays;
        log_->paths.push_back(wav_path);
        audio::WavData wav = audio::readWav(wav_path);
        assert(wav.sample_rate == 24000);
        assert(wav.samples.size() == 2400);
        return outcome_;
    }

private:
    std::shared_ptr<PlaybackLog> log_;
    audio::PlaybackOutcome outcome_;
};

struct Fixture {
    ScriptedEngine engine;
    std::shared_ptr<PlaybackLog> playback = std::make_shared<PlaybackLog>();
    std::unique_ptr<audio::AudioOutput> output;
    std::ostringstream acks;
    std::unique_ptr<Daemon> daemon;

    explicit Fixture(audio::PlaybackOutcome outcome = audio::PlaybackOutcome::Played,
                     const std::string& default_voice = "af_bella") {
        std::vector<std::unique_ptr<audio::AudioBackend>> backends;
        backends.push_back(std::make_unique<RecordingBackend>(playback, outcome));
        output = std::make_unique<audio::AudioOutput>(std::move(backends), std::chrono::milliseconds(1000));
        daemon = std::make_unique<Daemon>(engine, *output, acks, default_voice);
    }
};

std::vector<std::string> ackLines(const std::ostringstream& acks) {
    std::vector<std::string> lines;
    std::istringstream in(acks.str());
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Run the daemon over a pipe carrying `input`
int runOver(Fixture& f, const std::string& input, size_t max_line = 65536) {
    int fds[2];
    assert(::pipe(fds) == 0);
    assert(::write(fds[1], input.data(), input.size()) == static_cast<ssize_t>(input.size()));
    ::close(fds[1]);
    daemon::LineReader reader(fds[0], max_line, true);
    return f.daemon->run(reader);
}

} // anonymous namespace

void test_voice_then_speak() {
    Fixture f;
    for (const auto& voice : f.engine.voices) {
        assert(f.daemon->handleLine("VOICE:" + voice) == Ack::Ok);
        assert(f.daemon->handleLine("SPEAK:hello") == Ack::Ok);
        assert(f.daemon->session().active_voice == voice);
        assert(f.engine.calls.back().voice == voice);
        assert(f.engine.calls.back().text == "hello");
    }

    std::cout << "[PASS] test_voice_then_speak" << std::endl;
}

void test_unknown_voice_rejected() {
    Fixture f;
    assert(f.daemon->handleLine("VOICE:am_adam") == Ack::Ok);
    assert(f.daemon->handleLine("VOICE:not-a-real-voice") == Ack::Error);
    assert(f.daemon->session().active_voice == "am_adam");
    assert(f.daemon->handleLine("VOICE:") == Ack::Error);
    assert(f.daemon->session().active_voice == "am_adam");

    std::cout << "[PASS] test_unknown_voice_rejected" << std::endl;
}

void test_speed() {
    Fixture f;
    assert(f.daemon->handleLine("SPEED:1.5") == Ack::Ok);
    assert(f.daemon->handleLine("SPEAK:faster") == Ack::Ok);
    assert(std::fabs(f.engine.calls.back().speed - 1.5f) < 1e-6f);

    assert(f.daemon->handleLine("SPEED:abc") == Ack::Error);
    assert(std::fabs(f.daemon->session().speech_rate - 1.5f) < 1e-6f);
    assert(f.daemon->handleLine("SPEED:-2") == Ack::Error);
    assert(f.daemon->handleLine("SPEED:0") == Ack::Error);
    assert(std::fabs(f.daemon->session().speech_rate - 1.5f) < 1e-6f);

    std::cout << "[PASS] test_speed" << std::endl;
}

void test_voice_idempotent() {
    Fixture f;
    assert(f.daemon->handleLine("VOICE:af_sarah") == Ack::Ok);
    std::string voice = f.daemon->session().active_voice;
    float rate = f.daemon->session().speech_rate;

    assert(f.daemon->handleLine("VOICE:af_sarah") == Ack::Ok);
    assert(f.daemon->session().active_voice == voice);
    assert(f.daemon->session().speech_rate == rate);
    assert(f.engine.calls.empty());

    std::cout << "[PASS] test_voice_idempotent" << std::endl;
}

void test_plain_text_and_blank_lines() {
    Fixture f;
    assert(f.daemon->handleLine("Good morning") == Ack::Ok);
    assert(f.engine.calls.back().text == "Good morning");

    assert(!f.daemon->handleLine(""));
    assert(!f.daemon->handleLine("   \t"));
    assert(f.engine.calls.size() == 1);

    // Leading/trailing whitespace is not part of the request
    assert(f.daemon->handleLine("  SPEAK:  padded  ") == Ack::Ok);
    assert(f.engine.calls.back().text == "padded");

    assert(f.daemon->handleLine("SPEAK:") == Ack::Error);
    assert(f.engine.calls.size() == 2);

    std::cout << "[PASS] test_plain_text_and_blank_lines" << std::endl;
}

void test_failures_are_acknowledged() {
    Fixture f;
    f.engine.fail = true;
    assert(f.daemon->handleLine("SPEAK:boom") == Ack::Error);
    assert(f.daemon->isRunning());

    Fixture silent(audio::PlaybackOutcome::Failed);
    assert(silent.daemon->handleLine("SPEAK:nobody listens") == Ack::Error);
    assert(silent.playback->plays == 1);

    // Temp WAV is gone whether or not playback worked
    for (const auto& path : silent.playback->paths) {
        assert(::access(path.c_str(), F_OK) != 0);
    }

    std::cout << "[PASS] test_failures_are_acknowledged" << std::endl;
}

void test_default_voice_fallback() {
    Fixture preferred;
    assert(preferred.daemon->session().active_voice == "af_bella");
    assert(std::fabs(preferred.daemon->session().speech_rate - 1.0f) < 1e-6f);

    Fixture missing(audio::PlaybackOutcome::Played, "zz_nobody");
    assert(missing.daemon->session().active_voice == "af_bella");   // First in catalog order

    ScriptedEngine empty;
    empty.voices.clear();
    audio::AudioOutput output({}, std::chrono::milliseconds(10));
    std::ostringstream acks;
    bool threw = false;
    try {
        Daemon daemon(empty, output, acks, "af_bella");
    } catch (const tts::LoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_default_voice_fallback" << std::endl;
}

void test_quit_is_reserved() {
    Fixture f;
    assert(!f.daemon->handleLine("QUIT"));
    assert(!f.daemon->isRunning());
    assert(f.engine.calls.empty());
    assert(f.acks.str().empty());

    std::cout << "[PASS] test_quit_is_reserved" << std::endl;
}

void test_end_to_end() {
    Fixture f;
    int status = runOver(f, "VOICE:af_sarah\nSPEED:1.0\nSPEAK:Hello world\nQUIT\nSPEAK:never read\n");

    assert(status == 0);
    assert((ackLines(f.acks) == std::vector<std::string>{"OK", "OK", "OK"}));
    assert(f.engine.calls.size() == 1);
    assert(f.engine.calls[0].text == "Hello world");
    assert(f.engine.calls[0].voice == "af_sarah");
    assert(std::fabs(f.engine.calls[0].speed - 1.0f) < 1e-6f);
    assert(f.playback->plays == 1);

    std::cout << "[PASS] test_end_to_end" << std::endl;
}

void test_end_of_stream_and_overlong() {
    Fixture f;
    std::string input = "\nVOICE:bogus\n" + std::string(200, 'x') + "\nSPEAK:short\n";
    int status = runOver(f, input, 64);

    assert(status == 0);
    assert((ackLines(f.acks) == std::vector<std::string>{"ERROR", "ERROR", "OK"}));
    assert(f.engine.calls.size() == 1);
    assert(f.engine.calls[0].text == "short");

    std::cout << "[PASS] test_end_of_stream_and_overlong" << std::endl;
}

void test_stop_request() {
    Fixture f;
    f.daemon->requestStop();
    int status = runOver(f, "SPEAK:ignored\n");
    assert(status == 0);
    assert(f.acks.str().empty());
    assert(f.engine.calls.empty());

    std::cout << "[PASS] test_stop_request" << std::endl;
}

Daemon* g_stop_target = nullptr;

void stopHandler(int) {
    if (g_stop_target) {
        g_stop_target->requestStop();
    }
}

// run() is blocked on a pipe whose writer stays open
int runUntilStopped(Fixture& f, const std::string& input, std::function<void()> stopper) {
    int fds[2];
    assert(::pipe(fds) == 0);
    assert(::write(fds[1], input.data(), input.size()) == static_cast<ssize_t>(input.size()));

    std::thread helper([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        stopper();
    });

    daemon::LineReader reader(fds[0], 65536, true);
    auto start = std::chrono::steady_clock::now();
    int status = f.daemon->run(reader);
    auto elapsed = std::chrono::steady_clock::now() - start;

    helper.join();
    ::close(fds[1]);
    assert(elapsed < std::chrono::seconds(5));
    return status;
}

void test_signal_stops_blocked_read() {
    struct sigaction sa{};
    sa.sa_handler = stopHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    struct sigaction previous{};
    sigaction(SIGUSR1, &sa, &previous);

    Fixture f;
    g_stop_target = f.daemon.get();
    pthread_t loop_thread = pthread_self();
    int status = runUntilStopped(f, "SPEAK:before the signal\n", [loop_thread]() {
        pthread_kill(loop_thread, SIGUSR1);
    });
    g_stop_target = nullptr;
    sigaction(SIGUSR1, &previous, nullptr);

    assert(status == 0);
    assert(!f.daemon->isRunning());
    assert((ackLines(f.acks) == std::vector<std::string>{"OK"}));

    std::cout << "[PASS] test_signal_stops_blocked_read" << std::endl;
}

void test_stop_without_signal() {
    // The stop flag alone, no EINTR: the reader is woken through its pipe
    Fixture f;
    Daemon* target = f.daemon.get();
    int status = runUntilStopped(f, "VOICE:am_adam\n", [target]() { target->requestStop(); });

    assert(status == 0);
    assert(f.daemon->session().active_voice == "am_adam");
    assert((ackLines(f.acks) == std::vector<std::string>{"OK"}));

    std::cout << "[PASS] test_stop_without_signal" << std::endl;
}

int main() {
    std::cout << "=== Daemon Tests ===" << std::endl;
    log::setConsoleEnabled(false);

    test_voice_then_speak();
    test_unknown_voice_rejected();
    test_speed();
    test_voice_idempotent();
    test_plain_text_and_blank_lines();
    test_failures_are_acknowledged();
    test_default_voice_fallback();
    test_quit_is_reserved();
    test_end_to_end();
    test_end_of_stream_and_overlong();
    test_stop_request();
    test_signal_stops_blocked_read();
    test_stop_without_signal();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
