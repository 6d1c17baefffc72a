#include <gtest/gtest.h>
#include "security_logger.hpp"
#include <string>

using namespace netguard;

class SecurityLoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = SecurityLogger::min_level(); }
    void TearDown() override { SecurityLogger::set_min_level(saved_); }

private:
    SecurityLogger::Level saved_ = SecurityLogger::Level::INFO;
};

TEST_F(SecurityLoggerTest, Sanitization) {
    EXPECT_EQ(SecurityLogger::sanitize_log_message("plain text"), "plain text");
    EXPECT_EQ(SecurityLogger::sanitize_log_message("a \"quote\"\nnext"), "a  quote  next");
    EXPECT_EQ(SecurityLogger::sanitize_log_message(std::string("bell\x07") + "\x1b[31m"), "bell[31m");
}

TEST_F(SecurityLoggerTest, BlindsAddresses) {
    SecurityLogger::set_min_level(SecurityLogger::Level::DEBUG);

    testing::internal::CaptureStdout();
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CONNECTION_ACCEPTED,
                        "192.168.1.77", "Accepted connection");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out.find("192.168.1.77"), std::string::npos);
    EXPECT_NE(out.find("ip=anon_"), std::string::npos);
    EXPECT_NE(out.find("[CONNECTION_ACCEPTED]"), std::string::npos);
}

TEST_F(SecurityLoggerTest, InternalAddressesNotBlinded) {
    testing::internal::CaptureStdout();
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal", "x");
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "unknown", "y");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("ip=internal"), std::string::npos);
    EXPECT_NE(out.find("ip=unknown"), std::string::npos);
}

TEST_F(SecurityLoggerTest, ErrorsGoToStderr) {
    testing::internal::CaptureStderr();
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CRYPTO_FAILURE, "internal",
                        "authentication failed");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[ERROR] [CRYPTO_FAILURE]"), std::string::npos);
}

TEST_F(SecurityLoggerTest, MinLevelFiltersEvents) {
    SecurityLogger::set_min_level(SecurityLogger::Level::WARNING);

    testing::internal::CaptureStdout();
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "hidden");
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal", "shown");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("shown"), std::string::npos);
}

TEST_F(SecurityLoggerTest, ParseLevel) {
    SecurityLogger::Level level = SecurityLogger::Level::INFO;
    EXPECT_TRUE(SecurityLogger::parse_level("DEBUG", level));
    EXPECT_EQ(level, SecurityLogger::Level::DEBUG);
    EXPECT_TRUE(SecurityLogger::parse_level("warn", level));
    EXPECT_EQ(level, SecurityLogger::Level::WARNING);
    EXPECT_TRUE(SecurityLogger::parse_level("crit", level));
    EXPECT_EQ(level, SecurityLogger::Level::CRITICAL);
    EXPECT_FALSE(SecurityLogger::parse_level("verbose", level));
    EXPECT_EQ(level, SecurityLogger::Level::CRITICAL);
}

TEST_F(SecurityLoggerTest, EventNamesMatchEventTypes) {
    using Event = SecurityLogger::EventType;
    EXPECT_EQ(SecurityLogger::event_to_string(Event::CONNECTION_ACCEPTED), "CONNECTION_ACCEPTED");
    EXPECT_EQ(SecurityLogger::event_to_string(Event::CONNECTION_REJECTED), "CONNECTION_REJECTED");
    EXPECT_EQ(SecurityLogger::event_to_string(Event::RATE_LIMIT_HIT), "RATE_LIMIT_HIT");
    EXPECT_EQ(SecurityLogger::event_to_string(Event::INVALID_INPUT), "INVALID_INPUT");
    EXPECT_EQ(SecurityLogger::event_to_string(Event::CRYPTO_FAILURE), "CRYPTO_FAILURE");
    EXPECT_EQ(SecurityLogger::event_to_string(Event::TRANSPORT_ERROR), "TRANSPORT_ERROR");
    EXPECT_EQ(SecurityLogger::event_to_string(Event::CONFIG_ERROR), "CONFIG_ERROR");
    EXPECT_EQ(SecurityLogger::event_to_string(Event::LIFECYCLE), "LIFECYCLE");
}
