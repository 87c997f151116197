#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "child_process.hpp"
#include "launcher.hpp"
#include "readiness_reader.hpp"
#include "sidecar_error.hpp"

namespace littera {
namespace sidecar {

struct HandshakeOptions {
    std::string ready_prefix = kReadyPrefix;
    int ready_timeout_ms = 0;     // <= 0: wait for the sentinel indefinitely
    int shutdown_timeout_ms = 0;  // <= 0: wait for exit indefinitely; otherwise SIGKILL afterwards
    DiagnosticSink diagnostics;   // non-sentinel stdout lines
};

// SidecarHandle owns one running worker and the port it announced.
//
// The only way to obtain one is launch(), which returns a handle solely after a
// successful readiness handshake. Destroying the handle runs the shutdown protocol
// (close stdin, then wait for exit) unless shutdown() already ran it.
class SidecarHandle {
public:
    // Spawn `spec`, run the readiness handshake and wrap the result.
    // On failure returns nullptr with `error` set; any spawned process has
    // already been shut down and reaped by then.
    static std::unique_ptr<SidecarHandle> launch(const LaunchSpec &spec, const HandshakeOptions &options,
                                                 SidecarError &error);

    ~SidecarHandle();

    SidecarHandle(const SidecarHandle &) = delete;
    SidecarHandle &operator=(const SidecarHandle &) = delete;

    uint16_t port() const { return port_; }
    pid_t pid() const { return pid_; }

    // Shutdown protocol. Runs exactly once; later calls are no-ops.
    void shutdown();

    bool is_shut_down() const { return shut_down_; }

private:
    SidecarHandle(std::unique_ptr<ChildProcess> process, uint16_t port, int shutdown_timeout_ms);

    std::unique_ptr<ChildProcess> process_;
    uint16_t port_;
    pid_t pid_;
    int shutdown_timeout_ms_;
    bool shut_down_ = false;
};

}  // namespace sidecar
}  // namespace littera
