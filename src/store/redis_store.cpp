#include <utility>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>
#include <boost/redis/ignore.hpp>
#include <boost/redis/adapter/result.hpp>
#include <fmt/format.h>

#include "config/config.hpp"
#include "pool/errors.hpp"
#include "store/redis_store.hpp"

namespace {

    std::string scoreArg(double score) {
        return fmt::format("{}", score);
    }

    template <class T>
    T unwrap(redis::adapter::result<T>& result, const std::string& context) {
        if (result.has_error())
            throw StoreError(fmt::format("redis {} failed: {}", context, result.error().diagnostic));
        return std::move(result.value());
    }

}

template <class Response>
asio::awaitable<void> RedisStore::exec(
    const redis::request& req,
    Response& res,
    const std::string& context
) {
    try {
        co_await _redis.get().async_exec(req, res, asio::use_awaitable);
    } catch (const boost::system::system_error& e) {
        throw StoreError(fmt::format("redis {} failed: {}", context, e.what()), e.code());
    }
}

asio::awaitable<std::optional<std::string>> RedisStore::chooseAndLock(
    const std::string& key,
    double maxScore,
    double newScore
) {
    static const std::string script = R"(
        local element = redis.call('ZRANGEBYSCORE', KEYS[1], '-inf', ARGV[1], 'LIMIT', 0, 1)[1]
        if element == nil then
            return nil
        end
        redis.call('ZADD', KEYS[1], ARGV[2], element)
        return element
    )";

    redis::request req;
    req.push("EVAL", script, "1", key, scoreArg(maxScore), scoreArg(newScore));

    redis::response<std::optional<std::string>> res;
    const std::string context = "choose on " + key;
    co_await exec(req, res, context);

    co_return unwrap(std::get<0>(res), context);
}

asio::awaitable<bool> RedisStore::addIfNew(const std::string& key, const std::string& member, double score) {
    redis::request req;
    req.push("ZADD", key, "NX", scoreArg(score), member);

    redis::response<long long> res;
    const std::string context = "ZADD NX on " + key;
    co_await exec(req, res, context);

    co_return unwrap(std::get<0>(res), context) > 0;
}

asio::awaitable<void> RedisStore::upsert(const std::string& key, const std::string& member, double score) {
    redis::request req;
    req.push("ZADD", key, scoreArg(score), member);

    redis::response<long long> res;
    const std::string context = "ZADD on " + key;
    co_await exec(req, res, context);

    unwrap(std::get<0>(res), context);
}

asio::awaitable<bool> RedisStore::updateIfMember(const std::string& key, const std::string& member, double score) {
    static const std::string script = R"(
        if redis.call('ZSCORE', KEYS[1], ARGV[2]) == false then
            return 0
        end
        redis.call('ZADD', KEYS[1], ARGV[1], ARGV[2])
        return 1
    )";

    redis::request req;
    req.push("EVAL", script, "1", key, scoreArg(score), member);

    redis::response<long long> res;
    const std::string context = "update on " + key;
    co_await exec(req, res, context);

    co_return unwrap(std::get<0>(res), context) > 0;
}

asio::awaitable<bool> RedisStore::remove(const std::string& key, const std::string& member) {
    redis::request req;
    req.push("ZREM", key, member);

    redis::response<long long> res;
    const std::string context = "ZREM on " + key;
    co_await exec(req, res, context);

    co_return unwrap(std::get<0>(res), context) > 0;
}

asio::awaitable<size_t> RedisStore::addMany(
    const std::string& key,
    const std::vector<std::string>& members,
    double score
) {
    if (members.empty())
        co_return 0;

    const std::string s = scoreArg(score);

    // ZADD key score member [score member ...]
    std::vector<std::string> args;
    args.reserve(1 + 2 * members.size());
    args.push_back(key);
    for (const auto& member : members) {
        args.push_back(s);
        args.push_back(member);
    }

    redis::request req;
    req.push_range("ZADD", args);

    redis::response<long long> res;
    const std::string context = "ZADD batch on " + key;
    co_await exec(req, res, context);

    co_return static_cast<size_t>(unwrap(std::get<0>(res), context));
}

asio::awaitable<std::optional<double>> RedisStore::score(const std::string& key, const std::string& member) {
    redis::request req;
    req.push("ZSCORE", key, member);

    redis::response<std::optional<std::string>> res;
    const std::string context = "ZSCORE on " + key;
    co_await exec(req, res, context);

    const auto raw = unwrap(std::get<0>(res), context);
    if (!raw.has_value())
        co_return std::nullopt;

    try {
        co_return std::stod(*raw);
    } catch (const std::exception&) {
        throw StoreError(fmt::format("redis {} returned a non numeric score '{}'", context, *raw));
    }
}

asio::awaitable<size_t> RedisStore::count(const std::string& key) {
    redis::request req;
    req.push("ZCARD", key);

    redis::response<long long> res;
    const std::string context = "ZCARD on " + key;
    co_await exec(req, res, context);

    co_return static_cast<size_t>(unwrap(std::get<0>(res), context));
}

asio::awaitable<size_t> RedisStore::countUpTo(const std::string& key, double maxScore) {
    redis::request req;
    req.push("ZCOUNT", key, "-inf", scoreArg(maxScore));

    redis::response<long long> res;
    const std::string context = "ZCOUNT on " + key;
    co_await exec(req, res, context);

    co_return static_cast<size_t>(unwrap(std::get<0>(res), context));
}

asio::awaitable<void> RedisStore::swap(const std::string& src, const std::string& dst, bool preserveScores) {
    redis::request req;
    req.push("MULTI");

    // carry live scores over inside the transaction, a choose() landing
    // between the snapshot and the rename would otherwise lose its lease
    if (preserveScores) {
        const std::string intersectKey = src + VARS::INTERSECT_SUFFIX;
        req.push("ZINTERSTORE", intersectKey, "2", src, dst, "WEIGHTS", "0", "1");
        req.push("ZUNIONSTORE", src, "2", intersectKey, src, "WEIGHTS", "1", "0");
        req.push("DEL", intersectKey);
    }

    req.push("RENAME", src, dst);
    req.push("EXEC");

    redis::generic_response res;
    const std::string context = fmt::format("swap {} -> {}", src, dst);
    co_await exec(req, res, context);

    if (res.has_error())
        throw StoreError(fmt::format("redis {} failed: {}", context, res.error().diagnostic));
}

asio::awaitable<void> RedisStore::drop(const std::string& key) {
    redis::request req;
    req.push("DEL", key);

    redis::response<redis::ignore_t> res;
    const std::string context = "DEL on " + key;
    co_await exec(req, res, context);

    unwrap(std::get<0>(res), context);
}
