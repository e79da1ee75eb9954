#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "sagabus/config.hpp"
#include "sagabus/logging.hpp"

using namespace sagabus;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_sink([this](const nlohmann::json& record) { records.push_back(record); });
    }

    void TearDown() override {
        set_log_sink(nullptr);
        set_log_level(LogLevel::Info);
        unsetenv("PORT");
        unsetenv("SAGABUS_STORE_ENDPOINT");
        unsetenv("SAGABUS_LOG_LEVEL");
        unsetenv("SAGABUS_SERVICE_NAME");
    }

    std::vector<nlohmann::json> records;
};

// =============================================================================
// Records
// =============================================================================

TEST_F(LoggingTest, Log_ShouldEmitStructuredRecord) {
    log_info("saga-orchestrator", "saga_created", {{"saga_id", "X"}});

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["level"], "info");
    EXPECT_EQ(records[0]["component"], "saga-orchestrator");
    EXPECT_EQ(records[0]["message"], "saga_created");
    EXPECT_EQ(records[0]["saga_id"], "X");
    EXPECT_TRUE(records[0].contains("timestamp"));
}

TEST_F(LoggingTest, Log_BelowThreshold_ShouldBeDropped) {
    set_log_level(LogLevel::Warn);

    log_debug("c", "debug_record");
    log_info("c", "info_record");
    log_error("c", "error_record");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["message"], "error_record");
}

TEST_F(LoggingTest, ParseLogLevel_ShouldAcceptKnownNamesOnly) {
    LogLevel level = LogLevel::Info;

    EXPECT_TRUE(parse_log_level("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warning", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::Warn);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(LoggingTest, BusConfigFromEnv_Unset_ShouldUseDefaults) {
    auto config = BusConfig::from_env();

    EXPECT_EQ(config.listen_address, "0.0.0.0:51100");
    EXPECT_FALSE(config.uses_remote_store());
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.service_name, "sagabus");
}

TEST_F(LoggingTest, BusConfigFromEnv_Set_ShouldReadEveryVariable) {
    setenv("PORT", "6000", 1);
    setenv("SAGABUS_STORE_ENDPOINT", "http://store:51101", 1);
    setenv("SAGABUS_LOG_LEVEL", "debug", 1);
    setenv("SAGABUS_SERVICE_NAME", "orders", 1);

    auto config = BusConfig::from_env();

    EXPECT_EQ(config.listen_address, "0.0.0.0:6000");
    EXPECT_TRUE(config.uses_remote_store());
    EXPECT_EQ(config.store_endpoint, "store:51101");
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.service_name, "orders");
}

TEST_F(LoggingTest, BusConfigFromEnv_UnknownLevel_ShouldWarnAndUseInfo) {
    setenv("SAGABUS_LOG_LEVEL", "chatty", 1);

    auto config = BusConfig::from_env();

    EXPECT_EQ(config.log_level, LogLevel::Info);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["message"], "unknown_log_level");
    EXPECT_EQ(records[0]["value"], "chatty");
}
