#include <string>
#include <cmath>
#include <cstdlib>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <algorithm>

#include <fmt/format.h>

#include "config/settings.hpp"

namespace {

    std::optional<std::string> env(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0')
            return std::nullopt;
        return std::string(value);
    }

    [[noreturn]] void invalid(const char* name, const std::string& value, const char* expected) {
        throw std::invalid_argument(fmt::format("{}=\"{}\" is not {}", name, value, expected));
    }

    long long envInteger(const char* name, long long fallback, long long min) {
        const auto value = env(name);
        if (!value)
            return fallback;

        size_t used = 0;
        long long parsed = 0;
        try {
            parsed = std::stoll(*value, &used);
        } catch (const std::exception&) {
            invalid(name, *value, "an integer");
        }
        if (used != value->size())
            invalid(name, *value, "an integer");
        if (parsed < min)
            invalid(name, *value, fmt::format("at least {}", min).c_str());
        return parsed;
    }

    double envDouble(const char* name, double fallback) {
        const auto value = env(name);
        if (!value)
            return fallback;

        size_t used = 0;
        double parsed = 0;
        try {
            parsed = std::stod(*value, &used);
        } catch (const std::exception&) {
            invalid(name, *value, "a number");
        }
        if (used != value->size() || std::isnan(parsed))
            invalid(name, *value, "a number");
        return parsed;
    }

    bool envBool(const char* name, bool fallback) {
        const auto value = env(name);
        if (!value)
            return fallback;

        std::string lower = *value;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
            return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
            return false;
        invalid(name, *value, "a boolean");
    }

    redis::logger::level envLogLevel(const char* name, redis::logger::level fallback) {
        const auto value = env(name);
        if (!value)
            return fallback;

        using level = redis::logger::level;
        if (*value == "disabled") return level::disabled;
        if (*value == "emerg") return level::emerg;
        if (*value == "alert") return level::alert;
        if (*value == "crit") return level::crit;
        if (*value == "err") return level::err;
        if (*value == "warning") return level::warning;
        if (*value == "notice") return level::notice;
        if (*value == "info") return level::info;
        if (*value == "debug") return level::debug;
        invalid(name, *value, "a log level");
    }

}

Settings Settings::fromEnv() {
    Settings s;

    s.host = env("REDIS_HOST").value_or(s.host);
    s.port = std::to_string(envInteger("REDIS_PORT", std::stoll(s.port), 1));
    s.username = env("REDIS_USERNAME").value_or(s.username);
    s.password = env("REDIS_PASSWORD").value_or(s.password);
    if (env("REDIS_DB"))
        s.database = static_cast<int>(envInteger("REDIS_DB", 0, 0));
    s.connections = static_cast<size_t>(envInteger("REDIS_CONNECTIONS", s.connections, 1));
    s.logLevel = envLogLevel("REDIS_LOG_LEVEL", s.logLevel);

    s.poolKey = env("POOL_KEY").value_or(s.poolKey);
    s.leaseSeconds = envDouble("POOL_LEASE_SECONDS", s.leaseSeconds);
    s.batchSize = static_cast<size_t>(envInteger("POOL_BATCH_SIZE", s.batchSize, 1));
    s.strictReplace = envBool("POOL_STRICT_REPLACE", s.strictReplace);
    s.timeoutSeconds = envInteger("POOL_TIMEOUT_SECONDS", s.timeoutSeconds, 1);

    return s;
}

redis::config Settings::redisConfig() const {
    redis::config cfg;
    cfg.addr.host = host;
    cfg.addr.port = port;
    if (!username.empty())
        cfg.username = username;
    cfg.password = password;
    cfg.database_index = database;
    cfg.health_check_interval = std::chrono::seconds(CONFIG::HEALTH_CHECK_SEC);
    return cfg;
}

Pool::Options Settings::poolOptions() const {
    Pool::Options options;
    options.leaseSeconds = leaseSeconds;
    options.strictReplace = strictReplace;
    return options;
}
