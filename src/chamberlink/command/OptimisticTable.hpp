#pragma once

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace CL {

struct OptimisticEntry {
    std::string                           control_key;
    nlohmann::json                        proposed_value;
    std::chrono::steady_clock::time_point issued_at{};
    std::string                           command_id;
    std::uint64_t                         baseline_sequence{0};
    std::uint64_t                         generation{0};
};

/*
 * At most one entry per control key. Recording a key again supersedes the old
 * entry; every mutation names the generation it expects so a superseded
 * command cannot touch its successor.
 */
class OptimisticTable {
public:
    struct Recorded {
        std::uint64_t generation{0};
        std::uint64_t baseline{0};
    };

    // `sequence` is read after the entry is stored, so the returned baseline
    // never predates the optimistic write.
    auto record(std::string const& key, nlohmann::json value, std::string command_id,
                std::function<std::uint64_t()> const& sequence) -> Recorded;

    bool adopt(std::string const& key, std::uint64_t generation, nlohmann::json value);
    bool remove(std::string const& key, std::uint64_t generation);

    // Drops the entry but keeps showing its value until a snapshot newer than
    // `sequence` exists.
    bool linger(std::string const& key, std::uint64_t generation, std::uint64_t sequence);

    [[nodiscard]] bool isCurrent(std::string const& key, std::uint64_t generation) const;
    [[nodiscard]] bool isPending(std::string const& key) const;
    [[nodiscard]] auto entry(std::string const& key) const -> std::optional<OptimisticEntry>;
    [[nodiscard]] auto value(std::string const& key, std::uint64_t latest_sequence) const
        -> std::optional<nlohmann::json>;
    [[nodiscard]] auto pending() const -> std::vector<OptimisticEntry>;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    struct Lingering {
        nlohmann::json value;
        std::uint64_t  sequence{0};
    };

    mutable std::mutex                                 mutex_;
    phmap::flat_hash_map<std::string, OptimisticEntry> entries_;
    phmap::flat_hash_map<std::string, Lingering>       lingering_;
    std::uint64_t                                      nextGeneration_{1};
};

} // namespace CL
