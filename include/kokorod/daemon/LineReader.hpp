/**
 * LineReader.hpp - Bounded line reads from a file descriptor
 *
 * Reads with read(2) so that a signal interrupts a blocked read instead
 * of being retried transparently. wakeup() covers a signal that lands
 * just before the read blocks: the reader waits on its own pipe too.
 */

#pragma once

#include <string>

namespace kokorod::daemon {

enum class ReadStatus {
    Line,           // A complete line (without the newline)
    TooLong,        // Line exceeded the bound; it was discarded up to its newline
    EndOfStream,    // Writer side closed
    Interrupted,    // read(2) returned EINTR, or wakeup() was called
    Error           // Any other read error
};

class LineReader {
public:
    /**
     * @param fd        descriptor to read from (not owned unless `owns_fd`)
     * @param max_bytes longest accepted line
     * @throws std::system_error if the wake-up pipe cannot be created
     */
    LineReader(int fd, size_t max_bytes, bool owns_fd = false);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * Open a file or FIFO by path. With `keep_open` a FIFO is opened
     * read-write so the stream never reaches end-of-stream when the last
     * writer disconnects.
     * @throws std::system_error
     */
    static int openInput(const std::string& path, bool keep_open);

    ReadStatus readLine(std::string& line);

    /**
     * Make the current or next readLine() return Interrupted.
     * Async-signal-safe.
     */
    void wakeup() const noexcept;

    /// Description of the last Error status
    const std::string& lastError() const { return last_error_; }

private:
    bool drainWakeups();

    int fd_;
    size_t max_bytes_;
    bool owns_fd_;
    int wake_[2] = {-1, -1};
    std::string buffer_;
    bool eof_ = false;
    bool discarding_ = false;
    std::string last_error_;
};

} // namespace kokorod::daemon
