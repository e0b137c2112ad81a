#include "transport.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace sshmcp {

static void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

// ── StreamTransport ──────────────────────────────────────────────

StreamTransport::StreamTransport(std::istream& in, std::ostream& out, size_t max_message)
    : in_(in), out_(out), max_message_(max_message) {}

ReadStatus StreamTransport::read_message(std::string& out) {
    while (true) {
        std::string line;
        bool terminated = false;
        char c;
        while (in_.get(c)) {
            if (c == '\n') {
                terminated = true;
                break;
            }
            line.push_back(c);
            if (line.size() > max_message_) return ReadStatus::FramingError;
        }
        strip_cr(line);
        if (!line.empty()) {
            out = std::move(line);
            return ReadStatus::Message;
        }
        if (!terminated) return ReadStatus::Eof;
    }
}

bool StreamTransport::write_message(const std::string& message) {
    out_ << message << '\n';
    out_.flush();
    return static_cast<bool>(out_);
}

// ── FdTransport ──────────────────────────────────────────────────

FdTransport::FdTransport(int fd, size_t max_message, std::chrono::seconds idle_timeout,
                         const std::atomic<bool>* shutdown)
    : fd_(fd)
    , max_message_(max_message)
    , idle_timeout_(idle_timeout)
    , shutdown_(shutdown) {}

bool FdTransport::take_line(std::string& out) {
    while (true) {
        auto nl = buffer_.find('\n');
        if (nl == std::string::npos) return false;
        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        strip_cr(line);
        if (!line.empty()) {
            out = std::move(line);
            return true;
        }
    }
}

ReadStatus FdTransport::read_message(std::string& out) {
    auto idle_since = std::chrono::steady_clock::now();
    std::array<char, 4096> chunk;

    while (true) {
        if (take_line(out)) {
            if (out.size() > max_message_) return ReadStatus::FramingError;
            return ReadStatus::Message;
        }
        if (buffer_.size() > max_message_) return ReadStatus::FramingError;
        if (shutdown_ && shutdown_->load()) return ReadStatus::Eof;
        if (idle_timeout_.count() > 0 &&
            std::chrono::steady_clock::now() - idle_since > idle_timeout_) {
            return ReadStatus::Eof;
        }

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, 1000);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Eof;
        }
        if (ret == 0) continue;

        ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return ReadStatus::Eof;
        }
        if (n == 0) {
            // Peer closed; an unterminated last line still counts
            std::string rest = buffer_;
            buffer_.clear();
            strip_cr(rest);
            if (rest.empty()) return ReadStatus::Eof;
            if (rest.size() > max_message_) return ReadStatus::FramingError;
            out = std::move(rest);
            return ReadStatus::Message;
        }
        buffer_.append(chunk.data(), static_cast<size_t>(n));
        idle_since = std::chrono::steady_clock::now();
    }
}

bool FdTransport::write_message(const std::string& message) {
    std::string framed = message + "\n";
    size_t sent = 0;
    while (sent < framed.size()) {
        ssize_t n = ::send(fd_, framed.data() + sent, framed.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace sshmcp
