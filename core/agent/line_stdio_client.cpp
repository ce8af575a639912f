#include "line_stdio_client.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace agentlink {
namespace agent {

namespace {
constexpr LineStdioClient::PipeHandle kInvalidHandle = -1;
constexpr size_t kReadChunkSize = 64u * 1024u;

int remaining_ms(std::chrono::steady_clock::time_point start, int timeout_ms) {
    if (timeout_ms < 0) {
        return -1;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (elapsed_ms >= timeout_ms) {
        return 0;
    }
    return static_cast<int>(timeout_ms - elapsed_ms);
}
}  // namespace

LineStdioClient::LineStdioClient() : stdin_write_(kInvalidHandle), stdout_read_(kInvalidHandle) {}

LineStdioClient::~LineStdioClient() {
    // Note: Handles closed by AgentProcess, not here
}

void LineStdioClient::set_handles(PipeHandle stdin_write, PipeHandle stdout_read) {
    stdin_write_ = stdin_write;
    stdout_read_ = stdout_read;
    buffer_.clear();
    eof_ = false;
    broken_pipe_ = false;
    error_.clear();
}

bool LineStdioClient::write_line(const std::string &line, int timeout_ms) {
    error_.clear();
    if (stdin_write_ < 0) {
        error_ = "stdin pipe closed";
        broken_pipe_ = true;
        return false;
    }

    if (line.empty() || line.back() != '\n') {
        std::string framed = line;
        framed.push_back('\n');
        return write_exact(framed.data(), framed.size(), timeout_ms);
    }
    return write_exact(line.data(), line.size(), timeout_ms);
}

bool LineStdioClient::write_exact(const char *buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0) {
            int remaining = remaining_ms(start_time, timeout_ms);
            if (remaining == 0) {
                error_ = "Timeout writing line";
                return false;
            }

            struct pollfd pfd;
            pfd.fd = stdin_write_;
            pfd.events = POLLOUT;
            int result = poll(&pfd, 1, remaining);
            if (result < 0) {
                if (errno == EINTR) {
                    continue;
                }
                error_ = "poll failed: " + std::string(strerror(errno));
                return false;
            }
            if (result == 0) {
                continue;  // re-evaluated against the deadline
            }
            if ((pfd.revents & (POLLERR | POLLHUP)) != 0 && (pfd.revents & POLLOUT) == 0) {
                error_ = "Broken pipe (agent terminated)";
                broken_pipe_ = true;
                return false;
            }
        }

        ssize_t w = write(stdin_write_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                error_ = "Broken pipe (agent terminated)";
                broken_pipe_ = true;
            } else {
                error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool LineStdioClient::take_line(std::string &out) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    out.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    if (!out.empty() && out.back() == '\r') {
        out.pop_back();
    }
    return true;
}

long LineStdioClient::fill_buffer() {
    char chunk[kReadChunkSize];
    while (true) {
        ssize_t r = read(stdout_read_, chunk, sizeof(chunk));
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return -1;
        }
        if (r == 0) {
            eof_ = true;
            return 0;
        }
        buffer_.append(chunk, static_cast<size_t>(r));
        return static_cast<long>(r);
    }
}

ReadStatus LineStdioClient::read_line(std::string &out, int timeout_ms) {
    error_.clear();
    if (take_line(out)) {
        return ReadStatus::LINE;
    }
    if (eof_) {
        if (!buffer_.empty()) {
            out.swap(buffer_);
            buffer_.clear();
            return ReadStatus::LINE;
        }
        return ReadStatus::END_OF_STREAM;
    }
    if (stdout_read_ < 0) {
        error_ = "Invalid stdout pipe";
        return ReadStatus::ERROR;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (true) {
        int remaining = remaining_ms(start_time, timeout_ms);
        if (remaining == 0) {
            return ReadStatus::TIMEOUT;
        }

        if (!wait_for_data(remaining)) {
            if (!error_.empty()) {
                return ReadStatus::ERROR;
            }
            if (timeout_ms >= 0) {
                return ReadStatus::TIMEOUT;
            }
            continue;
        }

        long got = fill_buffer();
        if (got < 0) {
            return ReadStatus::ERROR;
        }
        if (take_line(out)) {
            return ReadStatus::LINE;
        }
        if (got == 0) {
            if (!buffer_.empty()) {
                out.swap(buffer_);
                buffer_.clear();
                return ReadStatus::LINE;
            }
            return ReadStatus::END_OF_STREAM;
        }
        if (buffer_.size() > kMaxLineSize) {
            error_ = "Line too large: " + std::to_string(buffer_.size()) + " bytes";
            buffer_.clear();
            return ReadStatus::ERROR;
        }
    }
}

ReadStatus LineStdioClient::read_available(std::string &out, int timeout_ms) {
    error_.clear();
    out.clear();
    if (!buffer_.empty()) {
        out.swap(buffer_);
        buffer_.clear();
        return ReadStatus::LINE;
    }
    if (eof_) {
        return ReadStatus::END_OF_STREAM;
    }
    if (!wait_for_data(timeout_ms)) {
        return error_.empty() ? ReadStatus::TIMEOUT : ReadStatus::ERROR;
    }
    long got = fill_buffer();
    if (got < 0) {
        return ReadStatus::ERROR;
    }
    if (got == 0) {
        return ReadStatus::END_OF_STREAM;
    }
    out.swap(buffer_);
    buffer_.clear();
    return ReadStatus::LINE;
}

bool LineStdioClient::wait_for_data(int timeout_ms) {
    error_.clear();
    if (stdout_read_ < 0) {
        error_ = "Invalid stdout pipe";
        return false;
    }

    struct pollfd pfd;
    pfd.fd = stdout_read_;
    pfd.events = POLLIN;
    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0) {
        if (errno == EINTR) {
            return false;
        }
        error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }

    // POLLHUP without POLLIN still means read() will return 0 (EOF)
    if ((pfd.revents & (POLLIN | POLLHUP)) != 0) {
        return true;
    }
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
        error_ = "poll error on stdout pipe";
    }
    return false;
}

void LineStdioClient::close_stdin() {
    if (stdin_write_ >= 0) {
        close(stdin_write_);
        stdin_write_ = kInvalidHandle;
    }
}

void LineStdioClient::close_stdout() {
    if (stdout_read_ >= 0) {
        close(stdout_read_);
        stdout_read_ = kInvalidHandle;
    }
}

}  // namespace agent
}  // namespace agentlink
