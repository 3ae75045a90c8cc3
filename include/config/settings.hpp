#pragma once

#include <string>
#include <optional>
#include <cstdint>

#include <boost/redis/config.hpp>
#include <boost/redis/logger.hpp>

#include "config/config.hpp"
#include "pool/pool.hpp"

namespace redis = boost::redis;

// Runtime settings, read from the environment. Malformed values throw
// std::invalid_argument naming the variable.
struct Settings {
    std::string host = VARS::REDIS_HOST;
    std::string port = VARS::REDIS_PORT;
    std::string username;
    std::string password;
    std::optional<int> database;
    size_t connections = CONFIG::REDIS_CONNECTIONS;
    redis::logger::level logLevel = redis::logger::level::emerg;

    std::string poolKey = VARS::POOL_KEY;
    double leaseSeconds = VARS::LEASE_SEC;
    size_t batchSize = CONFIG::RESET_BATCH_SIZE;
    bool strictReplace = false;
    int64_t timeoutSeconds = CONFIG::CLI_TIMEOUT_SEC;

    static Settings fromEnv();

    redis::config redisConfig() const;
    Pool::Options poolOptions() const;
};
