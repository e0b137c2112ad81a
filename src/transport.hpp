#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace sshmcp {

enum class ReadStatus { Message, Eof, FramingError };

// Newline-delimited message framing. One message per line; blank lines
// are skipped; a trailing '\r' is dropped.
class Transport {
public:
    virtual ~Transport() = default;
    virtual ReadStatus read_message(std::string& out) = 0;
    // Writes one message plus the terminating newline. False once the
    // peer is gone.
    virtual bool write_message(const std::string& message) = 0;
};

// stdio (or any iostream pair)
class StreamTransport : public Transport {
public:
    StreamTransport(std::istream& in, std::ostream& out, size_t max_message);

    ReadStatus read_message(std::string& out) override;
    bool write_message(const std::string& message) override;

private:
    std::istream& in_;
    std::ostream& out_;
    size_t max_message_;
};

// Connected socket. Reads poll in one-second slices so a shutdown flag
// can interrupt an idle connection.
class FdTransport : public Transport {
public:
    FdTransport(int fd, size_t max_message, std::chrono::seconds idle_timeout,
                const std::atomic<bool>* shutdown = nullptr);

    ReadStatus read_message(std::string& out) override;
    bool write_message(const std::string& message) override;

private:
    bool take_line(std::string& out);

    int fd_;
    size_t max_message_;
    std::chrono::seconds idle_timeout_;  // 0 = wait forever
    const std::atomic<bool>* shutdown_;
    std::string buffer_;
};

} // namespace sshmcp
