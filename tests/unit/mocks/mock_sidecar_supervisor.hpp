#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "sidecar/i_sidecar_supervisor.hpp"

namespace littera::tests {

using namespace littera;
using namespace testing;

class MockSidecarSupervisor : public sidecar::ISidecarSupervisor {
public:
    MOCK_METHOD(bool, open, (const std::string &, uint16_t &, sidecar::SidecarError &), (override));
    MOCK_METHOD(bool, port, (uint16_t &, sidecar::SidecarError &), (const, override));
    MOCK_METHOD(bool, close, (sidecar::SidecarError &), (override));
    MOCK_METHOD(bool, is_active, (), (const, override));

    // Default: empty slot that opens on port `p`
    void SetupEmptySlot(uint16_t p) {
        ON_CALL(*this, port(_, _)).WillByDefault([](uint16_t &, sidecar::SidecarError &error) {
            error.set(sidecar::ErrorCode::NOT_READY, "Sidecar not ready");
            return false;
        });
        ON_CALL(*this, open(_, _, _)).WillByDefault([p](const std::string &, uint16_t &out, sidecar::SidecarError &) {
            out = p;
            return true;
        });
        ON_CALL(*this, close(_)).WillByDefault(Return(true));
        ON_CALL(*this, is_active()).WillByDefault(Return(false));
    }

    void SetupReadySlot(uint16_t p) {
        ON_CALL(*this, port(_, _)).WillByDefault([p](uint16_t &out, sidecar::SidecarError &) {
            out = p;
            return true;
        });
        ON_CALL(*this, close(_)).WillByDefault(Return(true));
        ON_CALL(*this, is_active()).WillByDefault(Return(true));
    }

    void SetupOpenFailure(sidecar::ErrorCode code, const std::string &message) {
        ON_CALL(*this, open(_, _, _))
            .WillByDefault([code, message](const std::string &, uint16_t &, sidecar::SidecarError &error) {
                error.set(code, message);
                return false;
            });
    }
};

}  // namespace littera::tests
