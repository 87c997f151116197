#include "readiness_reader.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstring>
#include <limits>

namespace littera {
namespace sidecar {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; }

}  // namespace

LineReader::LineReader(int fd, int timeout_ms)
    : fd_(fd), timeout_ms_(timeout_ms), deadline_ms_(timeout_ms > 0 ? now_ms() + timeout_ms : 0) {}

LineReader::Status LineReader::wait_readable(int64_t deadline_ms) {
    while (true) {
        int64_t remaining = deadline_ms - now_ms();
        if (remaining <= 0) {
            error_ = "Timeout waiting for sidecar output";
            return Status::TIMEOUT;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int result = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining, std::numeric_limits<int>::max())));
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "poll failed: " + std::string(strerror(errno));
            return Status::READ_ERROR;
        }
        if (result == 0) {
            continue;  // re-check the deadline
        }
        // Readable, or POLLHUP: read() drains what is buffered and then reports EOF
        return Status::LINE;
    }
}

LineReader::Status LineReader::read_line(std::string &line) {
    line.clear();
    if (eof_) {
        return Status::END_OF_STREAM;
    }

    while (true) {
        if (timeout_ms_ > 0) {
            Status ready = wait_readable(deadline_ms_);
            if (ready != Status::LINE) {
                return ready;
            }
        }

        char c = 0;
        ssize_t r = read(fd_, &c, 1);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Failed to read sidecar stdout: " + std::string(strerror(errno));
            return Status::READ_ERROR;
        }
        if (r == 0) {
            eof_ = true;
            return line.empty() ? Status::END_OF_STREAM : Status::LINE;
        }
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return Status::LINE;
        }
        line.push_back(c);
    }
}

bool parse_ready_port(const std::string &value, uint16_t &port) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && is_space(value[begin])) ++begin;
    while (end > begin && is_space(value[end - 1])) --end;
    if (begin == end) {
        return false;
    }

    // One leading '+' is accepted, as an unsigned integer parse would
    if (value[begin] == '+') {
        ++begin;
        if (begin == end) {
            return false;
        }
    }

    const char *first = value.data() + begin;
    const char *last = value.data() + end;
    unsigned long parsed = 0;
    auto [ptr, ec] = std::from_chars(first, last, parsed, 10);
    if (ec != std::errc() || ptr != last) {
        return false;
    }
    if (parsed > std::numeric_limits<uint16_t>::max()) {
        return false;
    }

    port = static_cast<uint16_t>(parsed);
    return true;
}

bool read_readiness(int fd, const std::string &prefix, const DiagnosticSink &sink, int timeout_ms, uint16_t &port,
                    SidecarError &error) {
    LineReader reader(fd, timeout_ms);
    std::string line;

    while (true) {
        switch (reader.read_line(line)) {
            case LineReader::Status::LINE:
                break;
            case LineReader::Status::END_OF_STREAM:
                error.set(ErrorCode::EXITED_BEFORE_READY, "Sidecar exited before signaling readiness");
                return false;
            case LineReader::Status::TIMEOUT:
                error.set(ErrorCode::READY_TIMEOUT,
                          "Sidecar did not signal readiness within " + std::to_string(timeout_ms) + "ms");
                return false;
            case LineReader::Status::READ_ERROR:
            default:
                error.set(ErrorCode::READ_FAILED, reader.last_error());
                return false;
        }

        if (line.compare(0, prefix.size(), prefix) == 0) {
            std::string value = line.substr(prefix.size());
            if (!parse_ready_port(value, port)) {
                error.set(ErrorCode::MALFORMED_READY_SIGNAL, "Invalid port from sidecar: '" + value + "'");
                return false;
            }
            return true;
        }

        // Anything else is diagnostic output (e.g. database startup messages)
        if (sink) {
            sink(line);
        }
    }
}

}  // namespace sidecar
}  // namespace littera
