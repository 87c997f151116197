#include "sidecar_supervisor.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace littera {
namespace sidecar {

SidecarSupervisor::SidecarSupervisor(LaunchSpecFactory factory, HandshakeOptions options)
    : factory_(std::move(factory)), options_(std::move(options)) {
    if (!options_.diagnostics) {
        options_.diagnostics = [](const std::string &line) { LOG_INFO("[sidecar] " << line); };
    }
}

SidecarSupervisor::~SidecarSupervisor() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot_) {
        LOG_INFO("[Supervisor] Retiring worker on teardown");
        slot_.reset();
    }
}

bool SidecarSupervisor::acquire(std::unique_lock<std::mutex> &lock, SidecarError &error) const {
    try {
        lock.lock();
    } catch (const std::system_error &e) {
        error.set(ErrorCode::LOCK_FAILED, std::string("Failed to lock sidecar state: ") + e.what());
        LOG_ERROR("[Supervisor] " << error.message);
        return false;
    }
    return true;
}

bool SidecarSupervisor::open(const std::string &work_dir, uint16_t &port, SidecarError &error) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock, error)) {
        return false;
    }

    // Retire before install: the old worker has fully exited before the new one starts
    if (slot_) {
        LOG_INFO("[Supervisor] Replacing worker on port " << slot_->port());
        slot_.reset();
    }

    LaunchSpec spec;
    try {
        spec = factory_(work_dir);
    } catch (const std::exception &e) {
        error.set(ErrorCode::LAUNCH_FAILED, std::string("Failed to prepare sidecar launch: ") + e.what());
        LOG_ERROR("[Supervisor] " << error.message);
        return false;
    }

    auto handle = SidecarHandle::launch(spec, options_, error);
    if (!handle) {
        LOG_ERROR("[Supervisor] Failed to open " << work_dir << ": " << error.message);
        return false;
    }

    port = handle->port();
    slot_ = std::move(handle);
    LOG_INFO("[Supervisor] Sidecar ready on port " << port << " for " << work_dir);
    return true;
}

bool SidecarSupervisor::port(uint16_t &port, SidecarError &error) const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock, error)) {
        return false;
    }

    if (!slot_) {
        error.set(ErrorCode::NOT_READY, "Sidecar not ready");
        return false;
    }

    port = slot_->port();
    return true;
}

bool SidecarSupervisor::close(SidecarError &error) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock, error)) {
        return false;
    }

    // Dropping the handle runs its shutdown protocol
    slot_.reset();
    return true;
}

bool SidecarSupervisor::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_ != nullptr;
}

}  // namespace sidecar
}  // namespace littera
