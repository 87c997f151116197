#pragma once

#include <atomic>

namespace littera {
namespace runtime {

class SignalHandler {
public:
    // Route SIGINT/SIGTERM to the shutdown flag
    static void install();

    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace littera
