/**
 * kokoro_say.cpp - Send one request to a running kokorod over its FIFO
 *
 * Usage: kokoro-say [--fifo PATH] [--voice ID] [--speed RATE] TEXT...
 */

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

constexpr const char* DEFAULT_FIFO = "/tmp/kokoro-tts.fifo";

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--fifo PATH] [--voice ID] [--speed RATE] TEXT...\n"
              << "\n"
              << "  --fifo PATH    Request FIFO (default: " << DEFAULT_FIFO << ")\n"
              << "  --voice ID     Switch voice before speaking\n"
              << "  --speed RATE   Set the speaking rate before speaking\n";
}

// A request is exactly one line
std::string singleLine(std::string text) {
    for (char& c : text) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return text;
}

bool writeAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string fifo_path = DEFAULT_FIFO;
    std::string voice;
    std::string speed;
    std::vector<std::string> words;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--fifo" || arg == "--voice" || arg == "--speed") && i + 1 >= argc) {
            std::cerr << "kokoro-say: missing value for " << arg << "\n";
            return 1;
        }
        if (arg == "--fifo") {
            fifo_path = argv[++i];
        } else if (arg == "--voice") {
            voice = argv[++i];
        } else if (arg == "--speed") {
            speed = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) words.emplace_back(argv[i]);
        } else {
            words.push_back(arg);
        }
    }

    std::string text;
    for (const auto& word : words) {
        if (!text.empty()) text += ' ';
        text += word;
    }
    text = singleLine(text);

    if (text.find_first_not_of(" \t") == std::string::npos) {
        printUsage(argv[0]);
        return 1;
    }

    struct stat st{};
    if (::stat(fifo_path.c_str(), &st) != 0 || !S_ISFIFO(st.st_mode)) {
        std::cerr << "kokoro-say: Kokoro TTS server not running (no FIFO at " << fifo_path << ")\n";
        return 1;
    }

    // Non-blocking open fails with ENXIO instead of hanging when nobody reads
    int fd = ::open(fifo_path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENXIO) {
            std::cerr << "kokoro-say: Kokoro TTS server not running (no reader on " << fifo_path << ")\n";
        } else {
            std::cerr << "kokoro-say: cannot open " << fifo_path << ": " << std::strerror(errno) << "\n";
        }
        return 1;
    }

    // Back to blocking writes so a full pipe waits instead of failing
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    }

    std::signal(SIGPIPE, SIG_IGN);   // Report EPIPE instead of dying

    std::string request;
    if (!voice.empty()) request += "VOICE:" + singleLine(voice) + "\n";
    if (!speed.empty()) request += "SPEED:" + singleLine(speed) + "\n";
    request += "SPEAK:" + text + "\n";   // Text that looks like a command is still spoken

    bool ok = writeAll(fd, request);
    int saved_errno = errno;
    ::close(fd);

    if (!ok) {
        std::cerr << "kokoro-say: failed to communicate with Kokoro TTS server: "
                  << std::strerror(saved_errno) << "\n";
        return 1;
    }
    return 0;
}
