#include "linerpc/transport/stdio_transport.hpp"
#include "linerpc/error.hpp"
#include "linerpc/logger.hpp"
#include <log4cplus/loggingmacros.h>
#include <simdjson.h>
#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

namespace linerpc {

namespace {

std::atomic<bool> g_interrupted{false};
std::atomic<int> g_input_fd{-1};
std::atomic<int> g_null_fd{-1};

// Async-signal-safe: atomics and dup2 only
void on_input_signal(int) {
    g_interrupted.store(true);
    int null_fd = g_null_fd.load();
    if (null_fd >= 0) {
        ::dup2(null_fd, g_input_fd.load());
    }
}

} // anonymous namespace

bool end_input_on_signal(int signum, int fd) {
    if (g_null_fd.load() < 0) {
        int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd < 0) {
            LOG4CPLUS_WARN(transport_logger(), "Cannot open /dev/null: " << strerror(errno));
            return false;
        }
        g_null_fd.store(null_fd);
    }
    g_input_fd.store(fd);
    std::signal(signum, on_input_signal);
    return true;
}

bool input_interrupted() {
    return g_interrupted.load();
}

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    close();
}

bool StdioTransport::fill_buffer() {
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw RpcTransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) return false;
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }
}

std::string StdioTransport::take_line(size_t end, size_t next) {
    std::string line = buffer_.substr(0, end);
    buffer_.erase(0, next);
    scan_from_ = 0;

    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (!simdjson::validate_utf8(line.data(), line.size())) {
        throw RpcTransportError("Input is not valid UTF-8");
    }
    return line;
}

std::optional<std::string> StdioTransport::read_line() {
    while (true) {
        size_t nl = buffer_.find('\n', scan_from_);
        if (nl != std::string::npos) {
            return take_line(nl, nl + 1);
        }
        scan_from_ = buffer_.size();

        if (buffer_.size() > MAX_LINE_BYTES) {
            throw RpcTransportError("Input line exceeds " + std::to_string(MAX_LINE_BYTES) + " bytes");
        }
        if (eof_ || read_fd_ < 0) break;
        if (!fill_buffer()) {
            eof_ = true;
            LOG4CPLUS_DEBUG(transport_logger(), "End of input stream");
        }
    }

    // Unterminated last line
    if (!buffer_.empty()) {
        return take_line(buffer_.size(), buffer_.size());
    }
    return std::nullopt;
}

void StdioTransport::write_line(std::string_view line) {
    if (write_fd_ < 0) {
        throw RpcTransportError("Transport closed");
    }

    std::string out;
    out.reserve(line.size() + 1);
    out.append(line.data(), line.size());
    out += '\n';

    const char* data = out.data();
    size_t remaining = out.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw RpcTransportError(std::string("Write error: ") + strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::close() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    read_fd_ = -1;
    write_fd_ = -1;
    eof_ = true;
}

} // namespace linerpc
