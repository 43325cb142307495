/**
 * Session.hpp - Mutable per-process request state
 */

#pragma once

#include <atomic>
#include <string>

namespace kokorod::daemon {

struct Session {
    std::string active_voice;       // Always a member of the voice catalog
    float speech_rate = 1.0f;       // Finite, > 0
    std::atomic<bool> running{true};    // Written from the signal handler
};

} // namespace kokorod::daemon
