#include "sidecar_handle.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace littera {
namespace sidecar {

namespace {
// Kill deadline for a failed launch when no shutdown timeout is configured
constexpr int kFailedLaunchGraceMs = 2000;
}  // namespace

std::unique_ptr<SidecarHandle> SidecarHandle::launch(const LaunchSpec &spec, const HandshakeOptions &options,
                                                     SidecarError &error) {
    auto process = std::make_unique<ChildProcess>("sidecar", spec);

    if (!process->spawn()) {
        error.set(ErrorCode::LAUNCH_FAILED, process->last_error());
        return nullptr;
    }

    uint16_t port = 0;
    if (!read_readiness(process->stdout_fd(), options.ready_prefix, options.diagnostics, options.ready_timeout_ms,
                        port, error)) {
        LOG_ERROR("[Sidecar] Handshake failed (PID=" << process->pid() << "): " << error.message);
        // Reap the partial launch before reporting; dropping stdout first keeps a
        // still-writing worker from blocking on a full pipe. A failed launch is
        // always killed after a bounded wait, even when shutdown_timeout_ms is 0.
        process->close_stdout();
        process->shutdown(options.shutdown_timeout_ms > 0 ? options.shutdown_timeout_ms : kFailedLaunchGraceMs);
        return nullptr;
    }

    // The handshake is the only thing read from stdout; the worker reports through stderr from here on
    process->close_stdout();

    return std::unique_ptr<SidecarHandle>(new SidecarHandle(std::move(process), port, options.shutdown_timeout_ms));
}

SidecarHandle::SidecarHandle(std::unique_ptr<ChildProcess> process, uint16_t port, int shutdown_timeout_ms)
    : process_(std::move(process)), port_(port), pid_(process_->pid()), shutdown_timeout_ms_(shutdown_timeout_ms) {}

SidecarHandle::~SidecarHandle() { shutdown(); }

void SidecarHandle::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    LOG_INFO("[Sidecar] Stopping worker on port " << port_ << " (PID=" << pid_ << ")");

    // Closing stdin is the agreed graceful-shutdown signal
    process_->close_stdin();
    process_->shutdown(shutdown_timeout_ms_);

    LOG_INFO("[Sidecar] Worker on port " << port_ << " exited");
}

}  // namespace sidecar
}  // namespace littera
