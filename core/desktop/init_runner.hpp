#pragma once

#include <string>

#include "sidecar/launcher.hpp"
#include "sidecar/sidecar_error.hpp"

namespace littera {
namespace desktop {

// Runs a one-shot command to completion (stdin from /dev/null, stdout+stderr captured).
// A spawn failure is LAUNCH_FAILED; a non-zero exit is INIT_FAILED carrying the captured output.
bool run_init(const sidecar::LaunchSpec &spec, sidecar::SidecarError &error);

}  // namespace desktop
}  // namespace littera
