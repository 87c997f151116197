#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "i_sidecar_supervisor.hpp"
#include "launcher.hpp"
#include "sidecar_handle.hpp"

namespace littera {
namespace sidecar {

/**
 * @brief Lock-guarded slot holding at most one running sidecar worker
 *
 * Slot states: Empty -> Launching -> Ready -> Empty. Launching is never
 * observable from outside because open() holds the lock across the spawn
 * and the readiness handshake; a failed launch leaves the slot Empty.
 *
 * Thread Safety:
 * - Every public method takes the same exclusive lock for its whole
 *   critical section, so open()/close() never interleave
 * - open() blocks callers of port() until the handshake finishes
 * - An installed worker is always retired (shutdown protocol complete)
 *   before a replacement is spawned
 *
 * Usage Pattern:
 * ```cpp
 * SidecarSupervisor supervisor([&](const std::string &dir) { return launcher.describe_launch(dir); });
 * uint16_t port = 0;
 * SidecarError error;
 * if (!supervisor.open("/works/novel", port, error)) {
 *     // show error.message, let the user pick another work
 * }
 * ```
 */
class SidecarSupervisor : public ISidecarSupervisor {
public:
    using LaunchSpecFactory = std::function<LaunchSpec(const std::string &work_dir)>;

    /**
     * @param factory Builds the worker invocation for a work directory
     * @param options Handshake prefix, timeouts and diagnostic sink. When no sink is
     *                given, diagnostic lines are logged as "[sidecar] <line>".
     */
    explicit SidecarSupervisor(LaunchSpecFactory factory, HandshakeOptions options = {});

    // Retires the active worker, if any
    ~SidecarSupervisor() override;

    SidecarSupervisor(const SidecarSupervisor &) = delete;
    SidecarSupervisor &operator=(const SidecarSupervisor &) = delete;

    bool open(const std::string &work_dir, uint16_t &port, SidecarError &error) override;
    bool port(uint16_t &port, SidecarError &error) const override;
    bool close(SidecarError &error) override;
    bool is_active() const override;

private:
    LaunchSpecFactory factory_;
    HandshakeOptions options_;

    mutable std::mutex mutex_;
    std::unique_ptr<SidecarHandle> slot_;

    // Lock failures surface as LOCK_FAILED instead of escaping as std::system_error
    bool acquire(std::unique_lock<std::mutex> &lock, SidecarError &error) const;
};

}  // namespace sidecar
}  // namespace littera
