#include "init_runner.hpp"

#include "logging/logger.hpp"
#include "sidecar/child_process.hpp"

namespace littera {
namespace desktop {

bool run_init(const sidecar::LaunchSpec &spec, sidecar::SidecarError &error) {
    sidecar::ChildProcess::Options options;
    options.pipe_stdin = false;
    options.capture_stdout = true;
    options.merge_stderr = true;

    sidecar::ChildProcess process("littera-init", spec, options);
    if (!process.spawn()) {
        error.set(sidecar::ErrorCode::INIT_FAILED, "Failed to run littera init: " + process.last_error());
        return false;
    }

    std::string output;
    if (!process.read_all_stdout(output)) {
        LOG_WARN("[Init] " << process.last_error());
    }
    process.close_stdout();

    int status = -1;
    if (!process.wait_for_exit(0, &status)) {
        error.set(sidecar::ErrorCode::INIT_FAILED, "littera init failed: " + process.last_error());
        return false;
    }

    if (status != 0) {
        error.set(sidecar::ErrorCode::INIT_FAILED, "littera init failed: " + output);
        LOG_ERROR("[Init] exit status " << status << ": " << output);
        return false;
    }

    return true;
}

}  // namespace desktop
}  // namespace littera
