#include <gtest/gtest.h>
#include <cstdlib>
#include "service_config.hpp"
#include "stockroom/errors.hpp"

using namespace inventory;

class ServiceConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("STOCKROOM_PORT");
        unsetenv("STOCKROOM_DEFAULT_WAREHOUSE");
        unsetenv("STOCKROOM_MAX_ATTEMPTS");
        unsetenv("STOCKROOM_SNAPSHOT_INTERVAL");
    }
};

TEST_F(ServiceConfigTest, NoEnvironment_ShouldUseDefaults) {
    auto config = ServiceConfig::from_env();

    EXPECT_EQ(config.port, DEFAULT_PORT);
    EXPECT_EQ(config.default_warehouse, "WH-01");
    EXPECT_EQ(config.engine.max_attempts, 5);
    EXPECT_EQ(config.engine.snapshot_interval, 50u);
}

TEST_F(ServiceConfigTest, Environment_ShouldOverrideDefaults) {
    setenv("STOCKROOM_PORT", "6000", 1);
    setenv("STOCKROOM_DEFAULT_WAREHOUSE", "WH-EAST", 1);
    setenv("STOCKROOM_MAX_ATTEMPTS", "9", 1);
    setenv("STOCKROOM_SNAPSHOT_INTERVAL", "0", 1);

    auto config = ServiceConfig::from_env();

    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.default_warehouse, "WH-EAST");
    EXPECT_EQ(config.engine.max_attempts, 9);
    EXPECT_EQ(config.engine.snapshot_interval, 0u);
}

TEST_F(ServiceConfigTest, EmptyValue_ShouldBeIgnored) {
    setenv("STOCKROOM_PORT", "", 1);
    EXPECT_EQ(ServiceConfig::from_env().port, DEFAULT_PORT);
}

TEST_F(ServiceConfigTest, NonNumeric_ShouldThrow) {
    setenv("STOCKROOM_PORT", "http", 1);
    EXPECT_THROW(ServiceConfig::from_env(), stockroom::ValidationError);

    setenv("STOCKROOM_PORT", "80x", 1);
    EXPECT_THROW(ServiceConfig::from_env(), stockroom::ValidationError);
}

TEST_F(ServiceConfigTest, OutOfRange_ShouldThrow) {
    setenv("STOCKROOM_PORT", "70000", 1);
    EXPECT_THROW(ServiceConfig::from_env(), stockroom::ValidationError);
    unsetenv("STOCKROOM_PORT");

    setenv("STOCKROOM_MAX_ATTEMPTS", "0", 1);
    EXPECT_THROW(ServiceConfig::from_env(), stockroom::ValidationError);
}

TEST(ParsePortTest, ValidPort_ShouldParse) {
    EXPECT_EQ(parse_port("1"), 1);
    EXPECT_EQ(parse_port("65535"), 65535);
}

TEST(ParsePortTest, BadPort_ShouldThrow) {
    EXPECT_THROW(parse_port("abc"), stockroom::ValidationError);
    EXPECT_THROW(parse_port("8080x"), stockroom::ValidationError);
    EXPECT_THROW(parse_port("0"), stockroom::ValidationError);
    EXPECT_THROW(parse_port("65536"), stockroom::ValidationError);
    EXPECT_THROW(parse_port("99999999999999999999"), stockroom::ValidationError);
}
