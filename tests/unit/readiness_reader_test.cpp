/**
 * readiness_reader_test.cpp - Readiness handshake over real pipes
 *
 * Tests:
 * - Sentinel as first line, after diagnostics, CRLF, whitespace
 * - EOF before the sentinel, malformed and out-of-range ports
 * - Bytes after the sentinel stay unread
 * - Timeout when the writer stays silent
 */

#include "sidecar/readiness_reader.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <string>
#include <vector>

using namespace littera::sidecar;

class ReadinessReaderTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_EQ(pipe(fds_), 0); }

    void TearDown() override {
        close_write();
        if (fds_[0] >= 0) {
            close(fds_[0]);
        }
    }

    void write_text(const std::string &text) {
        ASSERT_EQ(write(fds_[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    }

    void close_write() {
        if (fds_[1] >= 0) {
            close(fds_[1]);
            fds_[1] = -1;
        }
    }

    bool handshake(uint16_t &port, SidecarError &error, int timeout_ms = 0) {
        return read_readiness(
            fds_[0], kReadyPrefix, [this](const std::string &line) { diagnostics_.push_back(line); }, timeout_ms,
            port, error);
    }

    int fds_[2] = {-1, -1};
    std::vector<std::string> diagnostics_;
};

TEST_F(ReadinessReaderTest, SentinelAsFirstLine) {
    write_text("LITTERA_SIDECAR_READY:54321\n");

    uint16_t port = 0;
    SidecarError error;
    ASSERT_TRUE(handshake(port, error)) << error.message;
    EXPECT_EQ(port, 54321);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(ReadinessReaderTest, DiagnosticsBeforeSentinelAreForwarded) {
    write_text("starting database\nmigrations ok\nLITTERA_SIDECAR_READY:8080\n");
    close_write();

    uint16_t port = 0;
    SidecarError error;
    ASSERT_TRUE(handshake(port, error)) << error.message;
    EXPECT_EQ(port, 8080);
    EXPECT_EQ(diagnostics_, (std::vector<std::string>{"starting database", "migrations ok"}));
}

TEST_F(ReadinessReaderTest, AcceptsCrLfAndSurroundingWhitespace) {
    write_text("LITTERA_SIDECAR_READY: 9000 \r\n");

    uint16_t port = 0;
    SidecarError error;
    ASSERT_TRUE(handshake(port, error)) << error.message;
    EXPECT_EQ(port, 9000);
}

TEST_F(ReadinessReaderTest, SentinelWithoutTrailingNewlineBeforeEof) {
    write_text("LITTERA_SIDECAR_READY:1234");
    close_write();

    uint16_t port = 0;
    SidecarError error;
    ASSERT_TRUE(handshake(port, error)) << error.message;
    EXPECT_EQ(port, 1234);
}

TEST_F(ReadinessReaderTest, EofBeforeSentinel) {
    write_text("some noise\n");
    close_write();

    uint16_t port = 0;
    SidecarError error;
    EXPECT_FALSE(handshake(port, error));
    EXPECT_EQ(error.code, ErrorCode::EXITED_BEFORE_READY);
    EXPECT_EQ(error.message, "Sidecar exited before signaling readiness");
    EXPECT_EQ(diagnostics_, (std::vector<std::string>{"some noise"}));
}

TEST_F(ReadinessReaderTest, EmptyOutput) {
    close_write();

    uint16_t port = 0;
    SidecarError error;
    EXPECT_FALSE(handshake(port, error));
    EXPECT_EQ(error.code, ErrorCode::EXITED_BEFORE_READY);
}

TEST_F(ReadinessReaderTest, MalformedPort) {
    write_text("LITTERA_SIDECAR_READY:notanumber\n");

    uint16_t port = 0;
    SidecarError error;
    EXPECT_FALSE(handshake(port, error));
    EXPECT_EQ(error.code, ErrorCode::MALFORMED_READY_SIGNAL);
    EXPECT_EQ(error.message, "Invalid port from sidecar: 'notanumber'");
}

TEST_F(ReadinessReaderTest, PortOutOfRangeIsMalformed) {
    write_text("LITTERA_SIDECAR_READY:70000\n");

    uint16_t port = 0;
    SidecarError error;
    EXPECT_FALSE(handshake(port, error));
    EXPECT_EQ(error.code, ErrorCode::MALFORMED_READY_SIGNAL);
}

TEST_F(ReadinessReaderTest, PrefixMustStartTheLine) {
    write_text("log: LITTERA_SIDECAR_READY:1111\nLITTERA_SIDECAR_READY:2222\n");

    uint16_t port = 0;
    SidecarError error;
    ASSERT_TRUE(handshake(port, error)) << error.message;
    EXPECT_EQ(port, 2222);
    ASSERT_EQ(diagnostics_.size(), 1u);
}

TEST_F(ReadinessReaderTest, LeavesBytesAfterSentinelUnread) {
    write_text("LITTERA_SIDECAR_READY:4000\nafter\n");
    close_write();

    uint16_t port = 0;
    SidecarError error;
    ASSERT_TRUE(handshake(port, error));

    char buf[16] = {0};
    ssize_t n = ::read(fds_[0], buf, sizeof(buf));
    EXPECT_EQ(std::string(buf, n > 0 ? static_cast<size_t>(n) : 0), "after\n");
}

TEST_F(ReadinessReaderTest, TimesOutWhenWriterStaysSilent) {
    write_text("still booting\n");

    uint16_t port = 0;
    SidecarError error;
    EXPECT_FALSE(handshake(port, error, 100));
    EXPECT_EQ(error.code, ErrorCode::READY_TIMEOUT);
    EXPECT_EQ(error.message, "Sidecar did not signal readiness within 100ms");
    EXPECT_EQ(diagnostics_, (std::vector<std::string>{"still booting"}));
}

TEST(ParseReadyPortTest, Boundaries) {
    uint16_t port = 1;
    EXPECT_TRUE(parse_ready_port("0", port));
    EXPECT_EQ(port, 0);
    EXPECT_TRUE(parse_ready_port("65535", port));
    EXPECT_EQ(port, 65535);

    EXPECT_FALSE(parse_ready_port("65536", port));
    EXPECT_FALSE(parse_ready_port("-1", port));
    EXPECT_FALSE(parse_ready_port("", port));
    EXPECT_FALSE(parse_ready_port("   ", port));
    EXPECT_FALSE(parse_ready_port("80 80", port));
    EXPECT_FALSE(parse_ready_port("0x50", port));
}

TEST(ParseReadyPortTest, AcceptsSingleLeadingPlus) {
    uint16_t port = 0;
    EXPECT_TRUE(parse_ready_port("+8080", port));
    EXPECT_EQ(port, 8080);
    EXPECT_TRUE(parse_ready_port(" +9000 ", port));
    EXPECT_EQ(port, 9000);

    EXPECT_FALSE(parse_ready_port("+", port));
    EXPECT_FALSE(parse_ready_port("++80", port));
    EXPECT_FALSE(parse_ready_port("+-80", port));
    EXPECT_FALSE(parse_ready_port("+ 80", port));
    EXPECT_FALSE(parse_ready_port("99999999999999999999", port));
}

TEST(LineReaderTest, SplitsLinesAndReportsEnd) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    std::string text = "one\r\ntwo\nthree";
    ASSERT_EQ(write(fds[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    close(fds[1]);

    LineReader reader(fds[0]);
    std::string line;
    ASSERT_EQ(reader.read_line(line), LineReader::Status::LINE);
    EXPECT_EQ(line, "one");
    ASSERT_EQ(reader.read_line(line), LineReader::Status::LINE);
    EXPECT_EQ(line, "two");
    ASSERT_EQ(reader.read_line(line), LineReader::Status::LINE);
    EXPECT_EQ(line, "three");
    EXPECT_EQ(reader.read_line(line), LineReader::Status::END_OF_STREAM);
    EXPECT_EQ(reader.read_line(line), LineReader::Status::END_OF_STREAM);

    close(fds[0]);
}
