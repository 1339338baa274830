#pragma once
#include "transport.hpp"
#include <unistd.h>
#include <string>

namespace linerpc {

/// StdioTransport reads newline-delimited text from stdin and writes to stdout.
/// Blocking and single-threaded: every write goes straight to the descriptor.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are owned and closed by the transport.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;
    void close() override;

    /// Upper bound on a single line; longer input is a transport failure.
    static constexpr size_t MAX_LINE_BYTES = 16 * 1024 * 1024;

private:
    bool fill_buffer();
    std::string take_line(size_t end, size_t next);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    bool eof_{false};
    std::string buffer_;
    size_t scan_from_{0};
};

/// On `signum`, swap `fd` for /dev/null so a blocked read_line() on it ends as
/// end-of-stream and the loop stops with a clean status. One descriptor is
/// tracked process-wide. Returns false if /dev/null cannot be opened.
bool end_input_on_signal(int signum, int fd = STDIN_FILENO);

/// True once a signal installed by end_input_on_signal has fired.
bool input_interrupted();

} // namespace linerpc
