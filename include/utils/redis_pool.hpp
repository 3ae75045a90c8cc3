#pragma once

#include <vector>
#include <memory>
#include <boost/asio/any_io_executor.hpp>
#include <boost/redis/config.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/logger.hpp>

namespace asio = boost::asio;
namespace redis = boost::redis;

// round robin over a fixed set of connections, all driven by one executor
class RedisPool {
private:
    std::vector<std::unique_ptr<redis::connection>> _connections;
    size_t _next{0};

public:
    RedisPool(
        const asio::any_io_executor& exec,
        const redis::config& cfg,
        size_t poolSize,
        redis::logger::level logLevel = redis::logger::level::emerg
    );

    redis::connection& get();
    redis::connection& operator[](size_t idx);
    size_t size() const { return _connections.size(); }

    // stops async_run on every connection so the executor can drain
    void cancel();
};
