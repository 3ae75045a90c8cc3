#pragma once

#include <utility>
#include <string>
#include <vector>
#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>

#include "config/config.hpp"
#include "pool/pool.hpp"
#include "pool/codec.hpp"
#include "store/pool_store.hpp"

namespace asio = boost::asio;

// Pool of typed items. Items are encoded when the call is made, so a
// malformed item throws before anything reaches the store.
template <class T, class Codec = ItemCodec<T>>
class ItemPool {

private:
    Pool _pool;

public:
    ItemPool(std::shared_ptr<PoolStore> store, std::string poolKey, Pool::Options options)
        : _pool(std::move(store), std::move(poolKey), std::move(options)) {};

    // A stored element that does not decode throws MalformedItemError, the
    // element stays leased until its lease runs out.
    asio::awaitable<T> choose() const {
        co_return Codec::decode(co_await _pool.choose());
    }

    asio::awaitable<void> replace(const T& item, std::optional<double> lockTill = std::nullopt) const {
        return _pool.replace(Codec::encode(item), lockTill);
    }

    asio::awaitable<bool> add(const T& item) const {
        return _pool.add(Codec::encode(item));
    }

    asio::awaitable<bool> remove(const T& item) const {
        return _pool.remove(Codec::encode(item));
    }

    asio::awaitable<size_t> reset(
        const std::vector<T>& items,
        size_t batchSize = CONFIG::RESET_BATCH_SIZE,
        bool preserveScores = false
    ) const {
        std::vector<std::string> elements;
        elements.reserve(items.size());
        for (const auto& item : items)
            elements.push_back(Codec::encode(item));
        return _pool.reset(std::move(elements), batchSize, preserveScores);
    }

    asio::awaitable<size_t> size() const { return _pool.size(); }
    asio::awaitable<size_t> available() const { return _pool.available(); }

    asio::awaitable<std::optional<double>> score(const T& item) const {
        return _pool.score(Codec::encode(item));
    }

    const Pool& pool() const { return _pool; }

};
