#include <utility>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "pool/errors.hpp"
#include "store/memory_store.hpp"

namespace {

    // a NaN breaks the ordering of byScore, reject it like redis does
    void checkScore(const std::string& key, double score) {
        if (std::isnan(score))
            throw StoreError(fmt::format("score for {} is not a valid float", key));
    }

}

bool MemoryStore::SortedSet::set(const std::string& member, double score) {
    const auto it = scores.find(member);
    if (it == scores.end()) {
        scores.emplace(member, score);
        byScore.emplace(score, member);
        return true;
    }

    byScore.erase({it->second, member});
    it->second = score;
    byScore.emplace(score, member);
    return false;
}

bool MemoryStore::SortedSet::erase(const std::string& member) {
    const auto it = scores.find(member);
    if (it == scores.end())
        return false;

    byScore.erase({it->second, member});
    scores.erase(it);
    return true;
}

asio::awaitable<std::optional<std::string>> MemoryStore::chooseAndLock(
    const std::string& key,
    double maxScore,
    double newScore
) {
    checkScore(key, maxScore);
    checkScore(key, newScore);
    std::lock_guard<std::mutex> lock(_mutex);

    const auto it = _sets.find(key);
    if (it == _sets.end())
        co_return std::nullopt;

    auto& set = it->second;
    const auto first = set.byScore.begin();
    if (first == set.byScore.end() || first->first > maxScore)
        co_return std::nullopt;

    std::string member = first->second;
    set.set(member, newScore);
    co_return member;
}

asio::awaitable<bool> MemoryStore::addIfNew(const std::string& key, const std::string& member, double score) {
    checkScore(key, score);
    std::lock_guard<std::mutex> lock(_mutex);

    auto& set = _sets[key];
    if (set.scores.contains(member))
        co_return false;

    set.set(member, score);
    co_return true;
}

asio::awaitable<void> MemoryStore::upsert(const std::string& key, const std::string& member, double score) {
    checkScore(key, score);
    std::lock_guard<std::mutex> lock(_mutex);
    _sets[key].set(member, score);
    co_return;
}

asio::awaitable<bool> MemoryStore::updateIfMember(const std::string& key, const std::string& member, double score) {
    checkScore(key, score);
    std::lock_guard<std::mutex> lock(_mutex);

    const auto it = _sets.find(key);
    if (it == _sets.end() || !it->second.scores.contains(member))
        co_return false;

    it->second.set(member, score);
    co_return true;
}

asio::awaitable<bool> MemoryStore::remove(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(_mutex);

    const auto it = _sets.find(key);
    if (it == _sets.end())
        co_return false;

    const bool removed = it->second.erase(member);
    if (it->second.scores.empty())
        _sets.erase(it);
    co_return removed;
}

asio::awaitable<size_t> MemoryStore::addMany(
    const std::string& key,
    const std::vector<std::string>& members,
    double score
) {
    checkScore(key, score);
    if (members.empty())
        co_return 0;

    std::lock_guard<std::mutex> lock(_mutex);

    auto& set = _sets[key];
    size_t added = 0;
    for (const auto& member : members)
        if (set.set(member, score))
            ++added;
    co_return added;
}

asio::awaitable<std::optional<double>> MemoryStore::score(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(_mutex);

    const auto it = _sets.find(key);
    if (it == _sets.end())
        co_return std::nullopt;

    const auto found = it->second.scores.find(member);
    if (found == it->second.scores.end())
        co_return std::nullopt;
    co_return found->second;
}

asio::awaitable<size_t> MemoryStore::count(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);

    const auto it = _sets.find(key);
    co_return it == _sets.end() ? 0 : it->second.scores.size();
}

asio::awaitable<size_t> MemoryStore::countUpTo(const std::string& key, double maxScore) {
    checkScore(key, maxScore);
    std::lock_guard<std::mutex> lock(_mutex);

    const auto it = _sets.find(key);
    if (it == _sets.end())
        co_return 0;

    size_t n = 0;
    for (const auto& [score, _] : it->second.byScore) {
        if (score > maxScore)
            break;
        ++n;
    }
    co_return n;
}

asio::awaitable<void> MemoryStore::swap(const std::string& src, const std::string& dst, bool preserveScores) {
    std::lock_guard<std::mutex> lock(_mutex);

    const auto it = _sets.find(src);
    if (it == _sets.end())
        throw StoreError(fmt::format("swap {} -> {} failed: no such key", src, dst));

    SortedSet moved = std::move(it->second);
    _sets.erase(it);

    if (preserveScores) {
        const auto live = _sets.find(dst);
        if (live != _sets.end()) {
            std::vector<std::pair<std::string, double>> carried;
            for (const auto& [member, _] : moved.scores) {
                const auto found = live->second.scores.find(member);
                if (found != live->second.scores.end())
                    carried.emplace_back(member, found->second);
            }
            for (const auto& [member, score] : carried)
                moved.set(member, score);
        }
    }

    _sets[dst] = std::move(moved);
    co_return;
}

asio::awaitable<void> MemoryStore::drop(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    _sets.erase(key);
    co_return;
}

std::vector<std::string> MemoryStore::keys() const {
    std::lock_guard<std::mutex> lock(_mutex);

    std::vector<std::string> out;
    out.reserve(_sets.size());
    for (const auto& [key, set] : _sets)
        if (!set.scores.empty())
            out.push_back(key);
    std::sort(out.begin(), out.end());
    return out;
}
