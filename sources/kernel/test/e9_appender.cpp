#include <gtest/gtest.h>

#include "kernel_test.hpp"

#include "logger/e9_appender.hpp"
#include "logger/logger.hpp"

class DebugPort final : public krtest::TestIntrin {
public:
    std::string output;
    uint8_t response = kr::E9Appender::kLogPort;

    void outbyte(uint16_t port, uint8_t data) noexcept override {
        if (port == kr::E9Appender::kLogPort) {
            output.push_back(char(data));
        }
    }

    uint8_t inbyte(uint16_t port) noexcept override {
        return (port == kr::E9Appender::kLogPort) ? response : 0xFF;
    }
};

class E9AppenderTest : public testing::Test {
public:
    void SetUp() override {
        ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);
    }

    DebugPort port;
    krtest::IntrinScope scope { &port };

    kr::E9Appender appender;
    kr::LogQueue queue;
    kr::Logger logger { "TEST", &queue };
};

TEST_F(E9AppenderTest, Available) {
    EXPECT_TRUE(kr::E9Appender::isAvailable());

    port.response = 0xFF;
    EXPECT_FALSE(kr::E9Appender::isAvailable());
}

TEST_F(E9AppenderTest, WriteMessage) {
    logger.infof("Mapped ", kr::Hex(0x1000), " bytes");
    EXPECT_EQ(port.output, "[TEST] Mapped 0x1000 bytes\n");
}

TEST_F(E9AppenderTest, Print) {
    logger.print("raw ", 42);
    EXPECT_EQ(port.output, "raw 42");
}
