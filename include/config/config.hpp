#pragma once

#include <cstddef>
#include <cstdint>

namespace CONFIG {
    inline constexpr size_t RESET_BATCH_SIZE = 500;
    inline constexpr size_t REDIS_CONNECTIONS = 4;
    inline constexpr double REPLACE_GRACE_SEC = 1.0; // replace() lands this far in the past
    inline constexpr int64_t CLI_TIMEOUT_SEC = 10;
    inline constexpr int64_t HEALTH_CHECK_SEC = 10;
}

namespace VARS {
    inline constexpr auto REDIS_HOST = "127.0.0.1";
    inline constexpr auto REDIS_PORT = "6379";
    inline constexpr auto POOL_KEY = "pool";
    inline constexpr double LEASE_SEC = 60.0;

    inline constexpr auto TEMP_KEY_SEPARATOR = "-";
    inline constexpr auto INTERSECT_SUFFIX = "-intersect";
}
