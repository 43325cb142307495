/**
 * PlayerBackend.cpp - External player invocation with a bounded wait
 *
 * Uses boost::process so a player that hangs can be killed and reaped
 * before the next backend is tried.
 */

#include "kokorod/audio/PlayerBackend.hpp"
#include "kokorod/util/Logger.hpp"

#include <cerrno>
#include <system_error>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/process.hpp>

namespace kokorod::audio {

namespace bp = boost::process;

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{10};

boost::filesystem::path resolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        boost::system::error_code ec;
        boost::filesystem::path path(program);
        return boost::filesystem::is_regular_file(path, ec) ? path : boost::filesystem::path();
    }
    return bp::search_path(program);
}

} // anonymous namespace

const char* toString(PlaybackOutcome outcome) {
    switch (outcome) {
        case PlaybackOutcome::Played:   return "played";
        case PlaybackOutcome::NotFound: return "not found";
        case PlaybackOutcome::TimedOut: return "timed out";
        case PlaybackOutcome::Failed:   return "failed";
    }
    return "failed";
}

PlayerBackend::PlayerBackend(std::vector<std::string> command)
    : command_(std::move(command)) {
}

std::string PlayerBackend::name() const {
    std::string joined;
    for (const auto& part : command_) {
        if (!joined.empty()) joined += ' ';
        joined += part;
    }
    return joined;
}

PlaybackOutcome PlayerBackend::play(const std::string& wav_path,
                                    std::chrono::milliseconds timeout) {
    if (command_.empty()) {
        return PlaybackOutcome::NotFound;
    }

    boost::filesystem::path exe = resolveProgram(command_.front());
    if (exe.empty()) {
        return PlaybackOutcome::NotFound;
    }

    std::vector<std::string> args(command_.begin() + 1, command_.end());
    args.push_back(wav_path);

    std::error_code ec;
    bp::child child(exe, bp::args(args),
                    bp::std_in < bp::null,
                    bp::std_out > bp::null,
                    bp::std_err > bp::null,
                    ec);

    if (ec) {
        if (ec.value() == ENOENT || ec.value() == EACCES) {
            return PlaybackOutcome::NotFound;
        }
        log::warn("PlayerBackend", name() + ": spawn failed: " + ec.message());
        return PlaybackOutcome::Failed;
    }

    // Polled: wait_for() misses a SIGCHLD delivered before it starts waiting
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (child.running(ec)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            std::error_code kill_ec;
            child.terminate(kill_ec);   // SIGKILL + reap
            return PlaybackOutcome::TimedOut;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    if (ec) {
        log::warn("PlayerBackend", name() + ": wait failed: " + ec.message());
        std::error_code kill_ec;
        child.terminate(kill_ec);
        return PlaybackOutcome::Failed;
    }

    int code = child.exit_code();
    if (code != 0) {
        log::debug("PlayerBackend", name() + " exited with " + std::to_string(code));
        return PlaybackOutcome::Failed;
    }
    return PlaybackOutcome::Played;
}

} // namespace kokorod::audio
