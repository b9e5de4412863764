#include "command/OptimisticTable.hpp"

#include <algorithm>

namespace CL {

auto OptimisticTable::record(std::string const& key, nlohmann::json value, std::string command_id,
                             std::function<std::uint64_t()> const& sequence) -> Recorded {
    std::lock_guard<std::mutex> lock(mutex_);
    auto generation = nextGeneration_++;
    lingering_.erase(key);
    auto& entry    = entries_[key];
    entry          = OptimisticEntry{key, std::move(value), std::chrono::steady_clock::now(), std::move(command_id), 0,
                                     generation};
    entry.baseline_sequence = sequence();
    return Recorded{generation, entry.baseline_sequence};
}

bool OptimisticTable::adopt(std::string const& key, std::uint64_t generation, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.generation != generation) {
        return false;
    }
    it->second.proposed_value = std::move(value);
    return true;
}

bool OptimisticTable::remove(std::string const& key, std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.generation != generation) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool OptimisticTable::linger(std::string const& key, std::uint64_t generation, std::uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.generation != generation) {
        return false;
    }
    lingering_[key] = Lingering{std::move(it->second.proposed_value), sequence};
    entries_.erase(it);
    return true;
}

bool OptimisticTable::isCurrent(std::string const& key, std::uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.generation == generation;
}

bool OptimisticTable::isPending(std::string const& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(key);
}

auto OptimisticTable::entry(std::string const& key) const -> std::optional<OptimisticEntry> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto OptimisticTable::value(std::string const& key, std::uint64_t latest_sequence) const
    -> std::optional<nlohmann::json> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second.proposed_value;
    }
    if (auto it = lingering_.find(key); it != lingering_.end() && latest_sequence <= it->second.sequence) {
        return it->second.value;
    }
    return std::nullopt;
}

auto OptimisticTable::pending() const -> std::vector<OptimisticEntry> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OptimisticEntry> out;
    out.reserve(entries_.size());
    for (auto const& [key, entry] : entries_) {
        out.push_back(entry);
    }
    std::sort(out.begin(), out.end(), [](auto const& lhs, auto const& rhs) { return lhs.generation < rhs.generation; });
    return out;
}

auto OptimisticTable::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace CL
