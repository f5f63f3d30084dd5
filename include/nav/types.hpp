#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lv::nav {

enum class Level { Account = 0, Subscription, Resource, Secret, Value };

inline constexpr size_t LEVEL_COUNT = 5;

enum class LevelState { Idle, Loading, Loaded, Failed };

std::string to_string(Level level);
std::string to_string(LevelState state);

// Captured when a load of `level` is dispatched, compared when it completes
struct LoadToken {
    Level level{Level::Account};
    uint64_t generation{0};
};

// Per-level indices saved by refresh and restored while they stay in bounds
struct SelectionPath {
    std::optional<size_t> account, subscription, resource, secret;
};

inline size_t index(const Level level) { return static_cast<size_t>(level); }

}
