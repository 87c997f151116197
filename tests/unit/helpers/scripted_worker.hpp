#pragma once

/**
 * scripted_worker.hpp - /bin/sh stand-ins for the sidecar worker
 *
 * Every worker appends "started <tag>" / "stopped <tag>" to a shared event log
 * so tests can check shutdown ordering and that each worker stopped exactly once.
 */

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "sidecar/launcher.hpp"

namespace littera {
namespace tests {

class TempDir {
public:
    explicit TempDir(const std::string &prefix) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::filesystem::path write_file(const std::string &name, const std::string &content) const {
        std::filesystem::path file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

// Worker bodies. Invoked as: /bin/sh <script> <tag> <event_log> [extra]

// Prints diagnostics, announces $3 as its port, then waits for stdin EOF
constexpr const char *kReadyWorker = R"(tag="$1"; log="$2"; port="$3"
echo "started $tag" >> "$log"
echo "booting database"
echo "loading work $tag"
echo "LITTERA_SIDECAR_READY:$port"
cat > /dev/null
echo "stopped $tag" >> "$log"
)";

// Announces its port then exits on its own
constexpr const char *kReadyThenExitWorker = R"(tag="$1"; log="$2"; port="$3"
echo "started $tag" >> "$log"
echo "diagnostic one"
echo "diagnostic two"
echo "LITTERA_SIDECAR_READY:$port"
echo "stopped $tag" >> "$log"
exit 0
)";

// Exits without any output
constexpr const char *kSilentExitWorker = R"(tag="$1"; log="$2"
echo "started $tag" >> "$log"
echo "stopped $tag" >> "$log"
exit 3
)";

// Sends a garbage port, then waits for stdin EOF like a normal worker
constexpr const char *kMalformedWorker = R"(tag="$1"; log="$2"; port="$3"
echo "started $tag" >> "$log"
echo "LITTERA_SIDECAR_READY:$port"
cat > /dev/null
echo "stopped $tag" >> "$log"
)";

// Never speaks and ignores stdin EOF
constexpr const char *kHungWorker = R"(tag="$1"; log="$2"
echo "started $tag" >> "$log"
exec sleep 30
)";

// Holds a scripted worker and the event log it writes to
class ScriptedWorker {
public:
    ScriptedWorker(const TempDir &dir, const std::string &name, const char *body)
        : script_(dir.write_file(name + ".sh", body)), log_(dir.path() / "events.log") {
        std::ofstream touch(log_, std::ios::app);
    }

    sidecar::LaunchSpec spec(const std::string &tag, const std::string &port = "") const {
        sidecar::LaunchSpec spec;
        spec.executable = "/bin/sh";
        spec.args = {script_.string(), tag, log_.string()};
        if (!port.empty()) {
            spec.args.push_back(port);
        }
        return spec;
    }

    const std::filesystem::path &log_path() const { return log_; }

    std::vector<std::string> events() const {
        std::vector<std::string> lines;
        std::ifstream in(log_);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    int count(const std::string &event) const {
        int n = 0;
        for (const auto &line : events()) {
            if (line == event) {
                ++n;
            }
        }
        return n;
    }

    // Poll the event log (workers that exit on their own write asynchronously)
    bool wait_for_event(const std::string &event, int timeout_ms = 5000) const {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (count(event) > 0) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

private:
    std::filesystem::path script_;
    std::filesystem::path log_;
};

}  // namespace tests
}  // namespace littera
