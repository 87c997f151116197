#include "desktop/init_runner.hpp"

#include <gtest/gtest.h>

using namespace littera;

TEST(InitRunnerTest, SuccessfulInit) {
    sidecar::SidecarError error;

    EXPECT_TRUE(desktop::run_init(sidecar::LaunchSpec{"/bin/sh", {"-c", "echo created; exit 0"}}, error));
    EXPECT_EQ(error.code, sidecar::ErrorCode::NONE);
}

TEST(InitRunnerTest, NonZeroExitCarriesOutput) {
    sidecar::SidecarError error;

    EXPECT_FALSE(desktop::run_init(
        sidecar::LaunchSpec{"/bin/sh", {"-c", "echo 'Error: already initialized' 1>&2; exit 1"}}, error));
    EXPECT_EQ(error.code, sidecar::ErrorCode::INIT_FAILED);
    EXPECT_NE(error.message.find("littera init failed: "), std::string::npos);
    EXPECT_NE(error.message.find("already initialized"), std::string::npos);
}

TEST(InitRunnerTest, MissingInterpreterIsInitFailure) {
    sidecar::SidecarError error;

    EXPECT_FALSE(desktop::run_init(sidecar::LaunchSpec{"/nonexistent/python", {"-m", "littera", "init", "/x"}}, error));
    EXPECT_EQ(error.code, sidecar::ErrorCode::INIT_FAILED);
    EXPECT_NE(error.message.find("Failed to run littera init"), std::string::npos);
}

TEST(InitRunnerTest, InitDoesNotWaitOnStdin) {
    sidecar::SidecarError error;

    // `cat` would block forever if stdin were an open pipe
    EXPECT_TRUE(desktop::run_init(sidecar::LaunchSpec{"/bin/sh", {"-c", "cat; exit 0"}}, error));
}
