#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "sidecar_error.hpp"

namespace littera {
namespace sidecar {

// Worker -> host handshake line: LITTERA_SIDECAR_READY:<port>
constexpr const char *kReadyPrefix = "LITTERA_SIDECAR_READY:";

// Receives every non-sentinel line verbatim
using DiagnosticSink = std::function<void(const std::string &line)>;

// Reads newline-terminated lines from a blocking descriptor one byte at a time,
// so nothing past the current line is ever consumed. Does not own the descriptor.
class LineReader {
public:
    enum class Status { LINE, END_OF_STREAM, READ_ERROR, TIMEOUT };

    // timeout_ms bounds the reader's whole lifetime, not each line; <= 0 blocks indefinitely
    explicit LineReader(int fd, int timeout_ms = 0);

    // Next line without its terminator ("\n" or "\r\n").
    // A final unterminated line is returned as LINE before END_OF_STREAM.
    Status read_line(std::string &line);

    const std::string &last_error() const { return error_; }

private:
    int fd_;
    int timeout_ms_;
    int64_t deadline_ms_;
    bool eof_ = false;
    std::string error_;

    // LINE once the descriptor is readable; TIMEOUT or READ_ERROR otherwise
    Status wait_readable(int64_t deadline_ms);
};

// Parse the text after the prefix. Surrounding whitespace is ignored;
// the rest must be a base-10 integer in [0, 65535].
bool parse_ready_port(const std::string &value, uint16_t &port);

// Single linear pass over the worker's stdout. Stops at the first sentinel line.
// Fails with EXITED_BEFORE_READY on EOF, MALFORMED_READY_SIGNAL on a bad port,
// READ_FAILED on I/O errors and READY_TIMEOUT when timeout_ms > 0 elapses.
bool read_readiness(int fd, const std::string &prefix, const DiagnosticSink &sink, int timeout_ms, uint16_t &port,
                    SidecarError &error);

}  // namespace sidecar
}  // namespace littera
