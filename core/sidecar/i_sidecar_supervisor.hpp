#pragma once

#include <cstdint>
#include <string>

#include "sidecar_error.hpp"

namespace littera {
namespace sidecar {

// Interface for SidecarSupervisor to enable mocking
class ISidecarSupervisor {
public:
    virtual ~ISidecarSupervisor() = default;

    // Retire any active worker, launch one for work_dir and wait for its port
    virtual bool open(const std::string &work_dir, uint16_t &port, SidecarError &error) = 0;

    // Port of the active worker; NOT_READY when the slot is empty
    virtual bool port(uint16_t &port, SidecarError &error) const = 0;

    // Retire the active worker, if any. Closing an empty slot succeeds.
    virtual bool close(SidecarError &error) = 0;

    virtual bool is_active() const = 0;
};

}  // namespace sidecar
}  // namespace littera
