#pragma once

#include <cstddef>
#include <string>

namespace agentlink {
namespace agent {

// Upper bound for a single protocol line. Assistant messages with large tool inputs can be big.
constexpr size_t kMaxLineSize = 16u * 1024u * 1024u;

enum class ReadStatus { LINE, TIMEOUT, END_OF_STREAM, ERROR };

// LineStdioClient manages newline-delimited communication over a child's stdin/stdout.
// Reads are buffered across calls: bytes after the first '\n' stay queued for the next read_line().
class LineStdioClient {
public:
    using PipeHandle = int;  // file descriptor

    LineStdioClient();
    ~LineStdioClient();

    // Delete copy/move (manages OS handles)
    LineStdioClient(const LineStdioClient &) = delete;
    LineStdioClient &operator=(const LineStdioClient &) = delete;

    // Initialize with pipe handles (stdin_write, stdout_read from parent's perspective)
    void set_handles(PipeHandle stdin_write, PipeHandle stdout_read);

    // Write one line; a trailing '\n' is appended if missing.
    // Returns false on error (sets error_, and broken_pipe() if the reader is gone)
    bool write_line(const std::string &line, int timeout_ms = -1);

    // Read one line (without the '\n'). timeout_ms < 0 blocks.
    // A final unterminated fragment before EOF is returned as a LINE.
    ReadStatus read_line(std::string &out, int timeout_ms);

    // Read whatever is available (raw bytes, no framing), waiting up to timeout_ms for the first byte
    ReadStatus read_available(std::string &out, int timeout_ms);

    // Wait for data on stdout. False on timeout or error (error_ set on error)
    bool wait_for_data(int timeout_ms);

    // Close stdin (signals EOF to the child)
    void close_stdin();
    void close_stdout();

    bool broken_pipe() const { return broken_pipe_; }
    const std::string &last_error() const { return error_; }

private:
    PipeHandle stdin_write_;
    PipeHandle stdout_read_;
    std::string buffer_;
    bool eof_ = false;
    bool broken_pipe_ = false;
    std::string error_;

    // One read() into buffer_. Returns bytes read, 0 on EOF, -1 on error
    long fill_buffer();
    bool take_line(std::string &out);

    bool write_exact(const char *buf, size_t n, int timeout_ms);
};

}  // namespace agent
}  // namespace agentlink
