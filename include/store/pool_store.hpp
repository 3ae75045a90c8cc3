#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace asio = boost::asio;

// Scored-set primitives a pool needs from its backing store. Every member of
// a set carries one score, and ordering is by score then by member bytes.
// Implementations report failures as StoreError.
class PoolStore {

public:
    virtual ~PoolStore() = default;

    // In one atomic step: take the lowest scored member with score <= maxScore,
    // give it newScore and return it. nullopt when nothing qualifies.
    virtual asio::awaitable<std::optional<std::string>> chooseAndLock(
        const std::string& key,
        double maxScore,
        double newScore
    ) = 0;

    // atomic insert, never touches an existing member's score
    virtual asio::awaitable<bool> addIfNew(const std::string& key, const std::string& member, double score) = 0;
    virtual asio::awaitable<void> upsert(const std::string& key, const std::string& member, double score) = 0;
    // atomic update, never inserts
    virtual asio::awaitable<bool> updateIfMember(const std::string& key, const std::string& member, double score) = 0;
    virtual asio::awaitable<bool> remove(const std::string& key, const std::string& member) = 0;

    // upserts every member with the same score, returns how many were new
    virtual asio::awaitable<size_t> addMany(
        const std::string& key,
        const std::vector<std::string>& members,
        double score
    ) = 0;

    virtual asio::awaitable<std::optional<double>> score(const std::string& key, const std::string& member) = 0;
    virtual asio::awaitable<size_t> count(const std::string& key) = 0;
    virtual asio::awaitable<size_t> countUpTo(const std::string& key, double maxScore) = 0;

    // Atomically replaces dst with src and removes src. With preserveScores,
    // members of src that are also in dst keep their dst score first.
    // src must exist.
    virtual asio::awaitable<void> swap(const std::string& src, const std::string& dst, bool preserveScores) = 0;
    virtual asio::awaitable<void> drop(const std::string& key) = 0;

};
