#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include "config/config.hpp"
#include "config/settings.hpp"
#include "utils/utils.hpp"

namespace {

const char* const VARIABLES[] = {
    "REDIS_HOST", "REDIS_PORT", "REDIS_USERNAME", "REDIS_PASSWORD", "REDIS_DB",
    "REDIS_CONNECTIONS", "REDIS_LOG_LEVEL", "POOL_KEY", "POOL_LEASE_SECONDS",
    "POOL_BATCH_SIZE", "POOL_STRICT_REPLACE", "POOL_TIMEOUT_SECONDS",
};

}  // namespace

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : VARIABLES)
            unsetenv(name);
    }
};

TEST_F(SettingsTest, DefaultsWithoutEnvironment) {
    const Settings s = Settings::fromEnv();

    EXPECT_EQ(s.host, VARS::REDIS_HOST);
    EXPECT_EQ(s.port, VARS::REDIS_PORT);
    EXPECT_FALSE(s.database.has_value());
    EXPECT_EQ(s.connections, CONFIG::REDIS_CONNECTIONS);
    EXPECT_EQ(s.poolKey, VARS::POOL_KEY);
    EXPECT_DOUBLE_EQ(s.leaseSeconds, VARS::LEASE_SEC);
    EXPECT_EQ(s.batchSize, CONFIG::RESET_BATCH_SIZE);
    EXPECT_FALSE(s.strictReplace);
}

TEST_F(SettingsTest, ReadsEnvironment) {
    setenv("REDIS_HOST", "redis.internal", 1);
    setenv("REDIS_PORT", "6380", 1);
    setenv("REDIS_DB", "3", 1);
    setenv("REDIS_CONNECTIONS", "8", 1);
    setenv("REDIS_LOG_LEVEL", "debug", 1);
    setenv("POOL_KEY", "proxies", 1);
    setenv("POOL_LEASE_SECONDS", "2.5", 1);
    setenv("POOL_BATCH_SIZE", "100", 1);
    setenv("POOL_STRICT_REPLACE", "Yes", 1);

    const Settings s = Settings::fromEnv();

    EXPECT_EQ(s.host, "redis.internal");
    EXPECT_EQ(s.port, "6380");
    EXPECT_EQ(s.database, 3);
    EXPECT_EQ(s.connections, 8u);
    EXPECT_EQ(s.logLevel, redis::logger::level::debug);
    EXPECT_EQ(s.poolKey, "proxies");
    EXPECT_DOUBLE_EQ(s.leaseSeconds, 2.5);
    EXPECT_EQ(s.batchSize, 100u);
    EXPECT_TRUE(s.strictReplace);

    const auto options = s.poolOptions();
    EXPECT_DOUBLE_EQ(options.leaseSeconds, 2.5);
    EXPECT_TRUE(options.strictReplace);

    const auto cfg = s.redisConfig();
    EXPECT_EQ(cfg.addr.host, "redis.internal");
    EXPECT_EQ(cfg.addr.port, "6380");
    EXPECT_EQ(cfg.database_index, 3);
}

TEST_F(SettingsTest, RejectsMalformedValues) {
    setenv("POOL_BATCH_SIZE", "0", 1);
    EXPECT_THROW(Settings::fromEnv(), std::invalid_argument);
    unsetenv("POOL_BATCH_SIZE");

    setenv("REDIS_PORT", "63x9", 1);
    EXPECT_THROW(Settings::fromEnv(), std::invalid_argument);
    unsetenv("REDIS_PORT");

    setenv("POOL_LEASE_SECONDS", "soon", 1);
    EXPECT_THROW(Settings::fromEnv(), std::invalid_argument);
    unsetenv("POOL_LEASE_SECONDS");

    setenv("POOL_LEASE_SECONDS", "nan", 1);
    EXPECT_THROW(Settings::fromEnv(), std::invalid_argument);
    unsetenv("POOL_LEASE_SECONDS");

    setenv("POOL_STRICT_REPLACE", "maybe", 1);
    EXPECT_THROW(Settings::fromEnv(), std::invalid_argument);
    unsetenv("POOL_STRICT_REPLACE");

    setenv("REDIS_LOG_LEVEL", "loud", 1);
    EXPECT_THROW(Settings::fromEnv(), std::invalid_argument);
}

TEST_F(SettingsTest, EnvFileDoesNotOverrideExportedValues) {
    const std::string path = ::testing::TempDir() + "leasepool_settings_test.env";
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "POOL_KEY = from-file\n";
        out << "REDIS_HOST=file-host\n";
    }
    setenv("REDIS_HOST", "exported-host", 1);

    Utils::loadENV(path);
    const Settings s = Settings::fromEnv();

    EXPECT_EQ(s.poolKey, "from-file");
    EXPECT_EQ(s.host, "exported-host");
    std::remove(path.c_str());
}

TEST_F(SettingsTest, EnvFileKeepsNonAsciiBytes) {
    const std::string path = ::testing::TempDir() + "leasepool_settings_utf8_test.env";
    {
        std::ofstream out(path);
        out << "POOL_KEY = caf\xc3\xa9 \n";
        out << "REDIS_HOST=\xc3\xa9host\n";
    }

    Utils::loadENV(path);
    const Settings s = Settings::fromEnv();

    EXPECT_EQ(s.poolKey, "caf\xc3\xa9");
    EXPECT_EQ(s.host, "\xc3\xa9host");
    std::remove(path.c_str());
}
