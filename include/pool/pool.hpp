#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "config/config.hpp"
#include "store/pool_store.hpp"

namespace asio = boost::asio;

/*
 * A pool of interchangeable items kept in one scored set of the store.
 *
 * Each member's score is the unix time at which it may next be chosen.
 * choose() hands out the eligible member with the lowest score and pushes its
 * score leaseSeconds into the future, so it stays a member but cannot be
 * chosen again until the lease lapses or it is replace()d. Ties go to the
 * lexicographically smallest member.
 *
 * The object holds no pool state of its own: any number of Pool instances, in
 * any number of processes, may share one key. Items are canonical strings
 * here, see ItemPool for typed items.
 */
class Pool {

public:
    struct Options {
        double leaseSeconds = VARS::LEASE_SEC;
        // replace() of a non member throws NotAMemberError instead of re-adding it
        bool strictReplace = false;
        // seconds since epoch, defaults to the system clock
        std::function<double()> clock;
    };

    Pool(std::shared_ptr<PoolStore> store, std::string poolKey, Options options);
    Pool(std::shared_ptr<PoolStore> store, std::string poolKey, double leaseSeconds);

    // Throws NoItemAvailableError when no member is eligible.
    asio::awaitable<std::string> choose() const;

    // Return an item. Without lockTill it is eligible immediately, otherwise
    // not before the unix time lockTill. Absent items are re-admitted unless
    // the pool is strict.
    asio::awaitable<void> replace(std::string item, std::optional<double> lockTill = std::nullopt) const;

    // false if the item was already a member, its score is left alone
    asio::awaitable<bool> add(std::string item) const;
    asio::awaitable<bool> remove(std::string item) const;

    // Rebuilds the pool under a temporary key and swaps it in atomically, the
    // current pool stays usable until then. Returns the number of distinct
    // members written. On failure the live pool is untouched.
    asio::awaitable<size_t> reset(
        std::vector<std::string> items,
        size_t batchSize = CONFIG::RESET_BATCH_SIZE,
        bool preserveScores = false
    ) const;

    asio::awaitable<size_t> size() const;
    asio::awaitable<size_t> available() const;
    asio::awaitable<std::optional<double>> score(std::string item) const;

    const std::string& key() const { return _key; }
    double leaseSeconds() const { return _options.leaseSeconds; }

private:
    std::shared_ptr<PoolStore> _store;
    std::string _key;
    Options _options;

    double now() const;

};
