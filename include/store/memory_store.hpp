#pragma once

#include <utility>
#include <set>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

#include <boost/asio/awaitable.hpp>

#include "store/pool_store.hpp"

namespace asio = boost::asio;

// Process local store with the same ordering rules as a redis ZSET. Empty
// sets cease to exist, like redis keys do.
class MemoryStore : public PoolStore {

private:
    struct SortedSet {
        std::set<std::pair<double, std::string>> byScore;
        std::unordered_map<std::string, double> scores;

        bool set(const std::string& member, double score);
        bool erase(const std::string& member);
    };

    mutable std::mutex _mutex;
    std::unordered_map<std::string, SortedSet> _sets;

public:
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

    // keys currently holding at least one member, sorted
    std::vector<std::string> keys() const;

};
