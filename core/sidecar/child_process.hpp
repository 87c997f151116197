#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "launcher.hpp"

namespace littera {
namespace sidecar {

// ChildProcess manages the lifecycle of one spawned worker process
// Responsibilities:
// - Spawn with a writable stdin pipe and a captured stdout pipe (stderr inherited)
// - Expose the stdout descriptor for the readiness handshake
// - Graceful shutdown: EOF on stdin, then reap
//
// Pipes are created close-on-exec so a later worker never inherits this one's
// stdin write end (which would stop EOF from ever reaching it).
class ChildProcess {
public:
    struct Options {
        bool pipe_stdin = true;       // false: child reads /dev/null
        bool capture_stdout = true;   // false: child inherits our stdout
        bool merge_stderr = false;    // route child stderr into the stdout pipe
    };

    ChildProcess(const std::string &name, const LaunchSpec &spec);
    ChildProcess(const std::string &name, const LaunchSpec &spec, Options options);

    // Runs shutdown() if the process was never reaped
    ~ChildProcess();

    // Delete copy/move
    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Spawn the process
    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // True while the process has been spawned and not yet reaped
    bool is_spawned() const { return pid_ > 0; }

    // Check if process is still running (a zombie counts as running until reaped)
    bool is_running() const;

    // Close our end of the child's stdin (signals EOF). Safe to call repeatedly.
    void close_stdin();

    // Release our end of the child's stdout
    void close_stdout();

    // Read stdout until EOF. Returns false on read error (sets error_).
    bool read_all_stdout(std::string &out);

    // Block until the process exits and reap it.
    // timeout_ms <= 0 waits indefinitely. Returns false on timeout or waitpid failure.
    bool wait_for_exit(int timeout_ms = 0, int *exit_status = nullptr);

    // SIGKILL, no reaping
    void force_terminate();

    // Shutdown sequence: EOF -> wait (-> kill -> wait when timeout_ms > 0)
    void shutdown(int timeout_ms = 0);

    int stdin_fd() const { return stdin_write_fd_; }
    int stdout_fd() const { return stdout_read_fd_; }
    pid_t pid() const { return pid_; }
    const std::string &name() const { return name_; }
    const LaunchSpec &spec() const { return spec_; }

    // Get last error
    const std::string &last_error() const { return error_; }

private:
    std::string name_;
    LaunchSpec spec_;
    Options options_;
    std::string error_;

    pid_t pid_;
    int stdin_write_fd_;
    int stdout_read_fd_;
};

}  // namespace sidecar
}  // namespace littera
