#include "nav/types.hpp"

namespace lv::nav {

std::string to_string(const Level level) {
    switch (level) {
        case Level::Account: return "account";
        case Level::Subscription: return "subscription";
        case Level::Resource: return "resource";
        case Level::Secret: return "secret";
        case Level::Value: return "value";
    }
    return "unknown";
}

std::string to_string(const LevelState state) {
    switch (state) {
        case LevelState::Idle: return "idle";
        case LevelState::Loading: return "loading";
        case LevelState::Loaded: return "loaded";
        case LevelState::Failed: return "failed";
    }
    return "unknown";
}

}
