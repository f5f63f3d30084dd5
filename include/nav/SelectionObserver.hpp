#pragma once

#include "cloud/Result.hpp"
#include "model/Mutation.hpp"
#include "nav/types.hpp"

#include <string>

namespace lv::nav {

// Host UI callbacks, always invoked on the UI thread
class SelectionObserver {
public:
    virtual ~SelectionObserver() = default;

    virtual void onLevelChanged(Level) {}
    virtual void onStatus(const std::string&) {}
    virtual void onProgress(size_t /*completed*/, size_t /*total*/, const std::string& /*currentId*/) {}
    virtual void onMutation(const model::SecretMutation&, const cloud::MutationResult&) {}
};

}
