#include "child_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"

extern char **environ;

namespace littera {
namespace sidecar {

namespace {

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Closes whatever is still open when it leaves scope
struct PipePair {
    int fds[2] = {-1, -1};

    ~PipePair() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }

    bool create() { return pipe2(fds, O_CLOEXEC) == 0; }

    int release(int end) {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }
};

// Owns posix_spawn_file_actions_t for the duration of spawn()
struct FileActions {
    posix_spawn_file_actions_t actions;
    bool initialized = false;

    ~FileActions() {
        if (initialized) {
            posix_spawn_file_actions_destroy(&actions);
        }
    }
};

}  // namespace

ChildProcess::ChildProcess(const std::string &name, const LaunchSpec &spec) : ChildProcess(name, spec, Options{}) {}

ChildProcess::ChildProcess(const std::string &name, const LaunchSpec &spec, Options options)
    : name_(name), spec_(spec), options_(options), pid_(-1), stdin_write_fd_(-1), stdout_read_fd_(-1) {}

ChildProcess::~ChildProcess() {
    shutdown();
    close_stdout();
}

bool ChildProcess::spawn() {
    error_.clear();

    if (pid_ > 0) {
        error_ = "Process already spawned (PID=" + std::to_string(pid_) + ")";
        return false;
    }
    if (spec_.executable.empty()) {
        error_ = "No executable configured for " + name_;
        LOG_ERROR("[" << name_ << "] " << error_);
        return false;
    }

    LOG_INFO("[" << name_ << "] Spawning: " << spec_.executable);

    PipePair stdin_pipe;
    PipePair stdout_pipe;

    if (options_.pipe_stdin && !stdin_pipe.create()) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if ((options_.capture_stdout || options_.merge_stderr) && !stdout_pipe.create()) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        return false;
    }

    FileActions fa;
    if (posix_spawn_file_actions_init(&fa.actions) != 0) {
        error_ = "Failed to initialize spawn file actions";
        return false;
    }
    fa.initialized = true;

    // dup2 clears close-on-exec on the target descriptor, so only 0/1/2 survive exec
    if (options_.pipe_stdin) {
        posix_spawn_file_actions_adddup2(&fa.actions, stdin_pipe.fds[0], STDIN_FILENO);
    } else {
        posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    }
    if (options_.capture_stdout || options_.merge_stderr) {
        posix_spawn_file_actions_adddup2(&fa.actions, stdout_pipe.fds[1], STDOUT_FILENO);
        if (options_.merge_stderr) {
            posix_spawn_file_actions_adddup2(&fa.actions, stdout_pipe.fds[1], STDERR_FILENO);
        }
    }
    // stderr otherwise stays connected to the parent's stderr

    std::vector<char *> argv;
    argv.reserve(spec_.args.size() + 2);
    argv.push_back(const_cast<char *>(spec_.executable.c_str()));
    for (const auto &arg : spec_.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // spawnp searches PATH for bare names and reports exec failures (ENOENT, EACCES) directly
    pid_t pid = -1;
    int result = posix_spawnp(&pid, spec_.executable.c_str(), &fa.actions, nullptr, argv.data(), environ);
    if (result != 0) {
        error_ = "Failed to spawn " + name_ + " (" + spec_.executable + "): " + std::string(strerror(result));
        LOG_ERROR("[" << name_ << "] " << error_);
        return false;
    }

    pid_ = pid;
    if (options_.pipe_stdin) {
        stdin_write_fd_ = stdin_pipe.release(1);
    }
    if (options_.capture_stdout || options_.merge_stderr) {
        stdout_read_fd_ = stdout_pipe.release(0);
    }

    LOG_INFO("[" << name_ << "] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool ChildProcess::is_running() const {
    if (pid_ <= 0) return false;
    // kill(0) tests existence without reaping
    return kill(pid_, 0) == 0;
}

void ChildProcess::close_stdin() { close_fd(stdin_write_fd_); }

void ChildProcess::close_stdout() { close_fd(stdout_read_fd_); }

bool ChildProcess::read_all_stdout(std::string &out) {
    if (stdout_read_fd_ < 0) {
        error_ = "stdout is not captured";
        return false;
    }

    char buf[4096];
    while (true) {
        ssize_t r = read(stdout_read_fd_, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            return true;  // EOF
        }
        out.append(buf, static_cast<size_t>(r));
    }
}

bool ChildProcess::wait_for_exit(int timeout_ms, int *exit_status) {
    if (pid_ <= 0) {
        return true;
    }

    auto record = [this, exit_status](int status) {
        if (exit_status != nullptr) {
            if (WIFEXITED(status)) {
                *exit_status = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                *exit_status = 128 + WTERMSIG(status);
            } else {
                *exit_status = -1;
            }
        }
        pid_ = -1;
    };

    if (timeout_ms <= 0) {
        while (true) {
            int status = 0;
            pid_t result = waitpid(pid_, &status, 0);
            if (result == pid_) {
                record(status);
                return true;
            }
            if (result == -1 && errno == EINTR) {
                continue;
            }
            if (result == -1 && errno == ECHILD) {
                // Reaped elsewhere
                pid_ = -1;
                return true;
            }
            error_ = "waitpid failed: " + std::string(strerror(errno));
            return false;
        }
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            record(status);
            return true;
        }
        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            error_ = "waitpid failed: " + std::string(strerror(errno));
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildProcess::force_terminate() {
    if (pid_ > 0) {
        kill(pid_, SIGKILL);
    }
}

void ChildProcess::shutdown(int timeout_ms) {
    if (pid_ <= 0) {
        close_stdin();
        return;
    }

    LOG_DEBUG("[" << name_ << "] Initiating shutdown (PID=" << pid_ << ")");

    // 1. Send EOF
    close_stdin();

    // 2. Wait (bounded only when a timeout is configured)
    if (wait_for_exit(timeout_ms)) {
        LOG_DEBUG("[" << name_ << "] Clean shutdown");
        return;
    }

    if (timeout_ms > 0) {
        // 3. Forced kill
        LOG_WARN("[" << name_ << "] Timeout after " << timeout_ms << "ms - forcing termination");
        force_terminate();
        if (!wait_for_exit()) {
            LOG_ERROR("[" << name_ << "] Failed to reap process: " << error_);
        }
        return;
    }

    LOG_ERROR("[" << name_ << "] Failed to reap process: " << error_);
}

}  // namespace sidecar
}  // namespace littera
