#include <utility>
#include <iostream>
#include <string>
#include <vector>
#include <cmath>
#include <algorithm>
#include <exception>
#include <stdexcept>

#include <boost/asio/awaitable.hpp>
#include <fmt/format.h>

#include "config/config.hpp"
#include "pool/pool.hpp"
#include "pool/errors.hpp"
#include "utils/utils.hpp"

Pool::Pool(
    std::shared_ptr<PoolStore> store,
    std::string poolKey,
    Options options
) : _store(std::move(store)), _key(std::move(poolKey)), _options(std::move(options)) {
    if (!_store)
        throw std::invalid_argument("Pool needs a store");
    if (_key.empty())
        throw std::invalid_argument("Pool key must not be empty");
    if (std::isnan(_options.leaseSeconds))
        throw std::invalid_argument("Pool lease duration must be a number");
}

Pool::Pool(
    std::shared_ptr<PoolStore> store,
    std::string poolKey,
    double leaseSeconds
) : Pool(std::move(store), std::move(poolKey), Options{leaseSeconds, false, {}}) {}

double Pool::now() const {
    return _options.clock ? _options.clock() : Utils::unixTime();
}

asio::awaitable<std::string> Pool::choose() const {
    const double now = this->now();
    const double lockTill = now + _options.leaseSeconds;

    auto element = co_await _store->chooseAndLock(_key, now, lockTill);
    if (!element.has_value())
        throw NoItemAvailableError(fmt::format("Pool \"{}\" has no available items.", _key));

    co_return std::move(*element);
}

asio::awaitable<void> Pool::replace(std::string item, std::optional<double> lockTill) const {
    if (lockTill.has_value() && std::isnan(*lockTill))
        throw std::invalid_argument(fmt::format("lock_till for \"{}\" must be a number", item));

    const double newScore = lockTill.has_value() ? *lockTill : now() - CONFIG::REPLACE_GRACE_SEC;

    if (!_options.strictReplace) {
        co_await _store->upsert(_key, item, newScore);
        co_return;
    }

    const bool updated = co_await _store->updateIfMember(_key, item, newScore);
    if (!updated)
        throw NotAMemberError(fmt::format("\"{}\" is not a member of pool \"{}\"", item, _key));
}

asio::awaitable<bool> Pool::add(std::string item) const {
    co_return co_await _store->addIfNew(_key, item, 0.0);
}

asio::awaitable<bool> Pool::remove(std::string item) const {
    co_return co_await _store->remove(_key, item);
}

asio::awaitable<size_t> Pool::reset(
    std::vector<std::string> items,
    size_t batchSize,
    bool preserveScores
) const {
    if (batchSize == 0)
        throw std::invalid_argument("reset batch size must be at least 1");

    const std::string tempKey = _key + VARS::TEMP_KEY_SEPARATOR + Utils::uuidHex();

    size_t written = 0;
    std::exception_ptr failure;
    try {
        std::vector<std::string> batch;
        batch.reserve(std::min(batchSize, items.size()));
        for (auto& item : items) {
            batch.push_back(std::move(item));
            if (batch.size() >= batchSize) {
                written += co_await _store->addMany(tempKey, batch, 0.0);
                batch.clear();
            }
        }
        // make sure we add any last elements
        if (!batch.empty())
            written += co_await _store->addMany(tempKey, batch, 0.0);

        // nothing was written so there is no temp set to swap in
        if (written == 0)
            co_await _store->drop(_key);
        else
            co_await _store->swap(tempKey, _key, preserveScores);
    } catch (const std::exception&) {
        failure = std::current_exception();
    }

    if (failure) {
        try {
            co_await _store->drop(tempKey);
        } catch (const std::exception& e) {
            std::cerr << "[ex] reset of " << _key << " left " << tempKey << " behind: " << e.what() << "\n";
        }
        std::rethrow_exception(failure);
    }

    std::clog << "reset " << _key << ": " << written << " items" << (preserveScores ? " (scores preserved)" : "") << std::endl;
    co_return written;
}

asio::awaitable<size_t> Pool::size() const {
    co_return co_await _store->count(_key);
}

asio::awaitable<size_t> Pool::available() const {
    co_return co_await _store->countUpTo(_key, now());
}

asio::awaitable<std::optional<double>> Pool::score(std::string item) const {
    co_return co_await _store->score(_key, item);
}
