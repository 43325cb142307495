/**
 * LineReader.cpp - read(2)-based line splitter
 */

#include "kokorod/daemon/LineReader.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kokorod::daemon {

namespace {

constexpr size_t READ_CHUNK = 4096;

} // anonymous namespace

LineReader::LineReader(int fd, size_t max_bytes, bool owns_fd)
    : fd_(fd)
    , max_bytes_(max_bytes)
    , owns_fd_(owns_fd) {
    if (::pipe2(wake_, O_CLOEXEC | O_NONBLOCK) != 0) {
        int err = errno;
        if (owns_fd_ && fd_ >= 0) {
            ::close(fd_);
        }
        throw std::system_error(err, std::generic_category(), "wake-up pipe");
    }
}

LineReader::~LineReader() {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
    ::close(wake_[0]);
    ::close(wake_[1]);
}

void LineReader::wakeup() const noexcept {
    char byte = 1;
    // EAGAIN means a wake-up is already pending
    ssize_t n = ::write(wake_[1], &byte, 1);
    (void)n;
}

bool LineReader::drainWakeups() {
    char scratch[64];
    bool woken = false;
    while (::read(wake_[0], scratch, sizeof(scratch)) > 0) {
        woken = true;
    }
    return woken;
}

int LineReader::openInput(const std::string& path, bool keep_open) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "stat " + path);
    }

    int flags = O_CLOEXEC;
    flags |= (S_ISFIFO(st.st_mode) && keep_open) ? O_RDWR : O_RDONLY;

    int fd;
    do {
        fd = ::open(path.c_str(), flags);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }
    return fd;
}

ReadStatus LineReader::readLine(std::string& line) {
    char chunk[READ_CHUNK];

    while (true) {
        size_t newline = buffer_.find('\n');

        if (discarding_) {
            if (newline != std::string::npos) {
                buffer_.erase(0, newline + 1);
                discarding_ = false;
                return ReadStatus::TooLong;
            }
            buffer_.clear();
        } else if (newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            return line.size() > max_bytes_ ? ReadStatus::TooLong : ReadStatus::Line;
        } else if (buffer_.size() > max_bytes_) {
            discarding_ = true;
            buffer_.clear();
        }

        if (eof_) {
            if (discarding_) {
                discarding_ = false;
                return ReadStatus::TooLong;
            }
            if (!buffer_.empty()) {
                // Final line without a trailing newline
                line = std::move(buffer_);
                buffer_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::EndOfStream;
        }

        struct pollfd fds[2] = {
            {fd_, POLLIN, 0},
            {wake_[0], POLLIN, 0},
        };
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                return ReadStatus::Interrupted;
            }
            last_error_ = std::strerror(errno);
            return ReadStatus::Error;
        }
        if ((fds[1].revents & POLLIN) && drainWakeups()) {
            return ReadStatus::Interrupted;
        }

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno == EINTR) {
            return ReadStatus::Interrupted;
        } else {
            last_error_ = std::strerror(errno);
            return ReadStatus::Error;
        }
    }
}

} // namespace kokorod::daemon
