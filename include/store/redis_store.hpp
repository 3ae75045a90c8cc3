#pragma once

#include <utility>
#include <string>
#include <vector>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>

#include "store/pool_store.hpp"
#include "utils/redis_pool.hpp"

namespace asio = boost::asio;
namespace redis = boost::redis;

// One ZSET per pool key. Multi step operations run as Lua scripts or inside
// MULTI/EXEC so other clients never observe the intermediate state.
class RedisStore : public PoolStore {

private:
    RedisPool& _redis;

    template <class Response>
    asio::awaitable<void> exec(const redis::request& req, Response& res, const std::string& context);

public:
    explicit RedisStore(RedisPool& redis) : _redis(redis) {};

    asio::awaitable<std::optional<std::string>> chooseAndLock(
        const std::string& key,
        double maxScore,
        double newScore
    ) override;

    asio::awaitable<bool> addIfNew(const std::string& key, const std::string& member, double score) override;
    asio::awaitable<void> upsert(const std::string& key, const std::string& member, double score) override;
    asio::awaitable<bool> updateIfMember(const std::string& key, const std::string& member, double score) override;
    asio::awaitable<bool> remove(const std::string& key, const std::string& member) override;

    asio::awaitable<size_t> addMany(
        const std::string& key,
        const std::vector<std::string>& members,
        double score
    ) override;

    asio::awaitable<std::optional<double>> score(const std::string& key, const std::string& member) override;
    asio::awaitable<size_t> count(const std::string& key) override;
    asio::awaitable<size_t> countUpTo(const std::string& key, double maxScore) override;

    asio::awaitable<void> swap(const std::string& src, const std::string& dst, bool preserveScores) override;
    asio::awaitable<void> drop(const std::string& key) override;

};
