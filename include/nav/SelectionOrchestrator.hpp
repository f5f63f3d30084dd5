#pragma once

#include "auth/TokenCache.hpp"
#include "cloud/ResourceFetcher.hpp"
#include "concurrency/BulkLoader.hpp"
#include "concurrency/MainLoop.hpp"
#include "concurrency/ThreadPool.hpp"
#include "nav/RevealTimer.hpp"
#include "nav/SelectionObserver.hpp"
#include "nav/SubscriptionGroups.hpp"
#include "nav/types.hpp"

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lv::nav {

struct OrchestratorOptions {
    std::chrono::seconds revealTimeout{120};
    size_t statusNameWidth{30};
};

// Cascading account > subscription > resource > secret > value controller.
// Every public method must be called on the UI thread, the one pumping `loop`. Background results
// come back through the loop and are applied only while their LoadToken is still current.
class SelectionOrchestrator {
public:
    SelectionOrchestrator(cloud::ResourceFetcher& fetcher,
                          auth::TokenCache& tokens,
                          concurrency::ThreadPool& pool,
                          concurrency::BulkLoader& bulk,
                          concurrency::MainLoop& loop,
                          OrchestratorOptions options = {},
                          const util::Clock& clock = util::systemClock());

    ~SelectionOrchestrator();

    SelectionOrchestrator(const SelectionOrchestrator&) = delete;
    SelectionOrchestrator& operator=(const SelectionOrchestrator&) = delete;

    void setObserver(SelectionObserver* observer) { observer_ = observer; }

    // Root load; auto-cascades down to the first secret
    void start();

    bool selectAccount(size_t i);
    bool selectSubscription(size_t i);
    bool selectResource(size_t i);
    bool selectSecret(size_t i);

    void setFilter(const std::string& filter);
    void refresh(bool force);

    // Queued on the background pool; false when nothing is selected to act on
    bool mutate(model::SecretMutation mutation);
    bool editSelected(const std::string& value);
    bool createSecret(const std::string& name, const std::string& value);
    bool deleteSelected();

    // Value of the selected secret, audited; empty when none is loaded
    std::optional<std::string> reveal();
    std::optional<std::string> copy();
    void hide();
    [[nodiscard]] bool isRevealed() const;

    // Auto-hides an expired reveal
    void tick();

    // Runs `fn` only while `token` is the newest load of its level
    bool applyIfCurrent(const LoadToken& token, const std::function<void()>& fn);

    [[nodiscard]] LoadToken currentToken(Level level) const;
    [[nodiscard]] LevelState state(Level level) const { return states_[index(level)]; }
    [[nodiscard]] const std::optional<cloud::Error>& error(Level level) const { return errors_[index(level)]; }
    [[nodiscard]] std::optional<size_t> selected(Level level) const { return selected_[index(level)]; }

    // Error kind followed by the message split into lines
    [[nodiscard]] std::vector<std::string> errorLines(Level level) const;

    [[nodiscard]] const std::vector<std::string>& owners() const { return owners_; }
    [[nodiscard]] const std::vector<SubscriptionEntry>& subscriptions() const { return subscriptions_; }
    [[nodiscard]] const std::vector<model::Resource>& resources() const { return resources_; }
    [[nodiscard]] const std::vector<model::SecretMeta>& secrets() const { return filteredSecrets_; }
    [[nodiscard]] const std::vector<model::SecretMeta>& allSecrets() const { return secrets_; }
    [[nodiscard]] const std::optional<model::SecretValue>& value() const { return value_; }
    [[nodiscard]] const std::string& filter() const { return filter_; }
    [[nodiscard]] const std::string& status() const { return status_; }

    [[nodiscard]] std::optional<model::Resource> selectedResource() const;
    [[nodiscard]] std::optional<model::SecretMeta> selectedSecret() const;

    // No load or mutation outstanding; background warm-up does not count
    [[nodiscard]] bool isIdle() const { return pending_ == 0; }

private:
    using Alive = std::shared_ptr<bool>;

    // Bumps the generation of `from` and every deeper level and clears their content
    void resetFrom(Level from);
    LoadToken beginLoad(Level level);

    // Posts a background task's completion to the UI thread under the staleness guard
    template <typename R>
    void dispatch(Level level, std::function<R()> work, std::function<void(R&)> apply);

    void loadAccounts();
    void applyAccounts(const std::vector<model::Account>& accounts, bool cached);
    void loadSubscriptions(const std::string& owner);
    void warmResources(const std::vector<model::Account>& subscriptions);
    void loadResources(const SubscriptionEntry& entry);
    void loadGroup(const SubscriptionEntry& entry);
    void applyResources(std::vector<model::Resource> resources, bool cached, const std::string& warning = {});
    void loadSecrets(const model::Resource& resource);
    void applySecrets(std::vector<model::SecretMeta> secrets, bool cached);
    void loadValue(const model::Resource& resource, const std::string& name);

    void fail(Level level, const cloud::Error& err);
    void loaded(Level level);
    void finishPending();

    // Saved index for `level` while in bounds, else the first selectable item
    std::optional<size_t> cascadeIndex(Level level, size_t count);

    void setStatus(const std::string& message);
    void notifyLevel(Level level);
    void audit(const std::string& action, const model::Resource& resource, const std::string& name) const;
    [[nodiscard]] std::string shortName(const std::string& name) const;
    [[nodiscard]] std::string revealKey() const;

    cloud::ResourceFetcher& fetcher_;
    auth::TokenCache& tokens_;
    concurrency::ThreadPool& pool_;
    concurrency::BulkLoader& bulk_;
    concurrency::MainLoop& loop_;
    OrchestratorOptions options_;
    RevealTimer reveal_;
    SelectionObserver* observer_{nullptr};

    // Posted callbacks hold a weak reference and do nothing once the orchestrator is gone
    Alive alive_ = std::make_shared<bool>(true);

    std::array<uint64_t, LEVEL_COUNT> generations_{};
    std::array<LevelState, LEVEL_COUNT> states_{};
    std::array<std::optional<cloud::Error>, LEVEL_COUNT> errors_{};
    std::array<std::optional<size_t>, LEVEL_COUNT> selected_{};

    std::vector<model::Account> accounts_;
    std::vector<std::string> owners_;
    std::vector<SubscriptionEntry> subscriptions_;
    std::vector<model::Resource> resources_;
    std::vector<model::SecretMeta> secrets_;
    std::vector<model::SecretMeta> filteredSecrets_;
    std::optional<model::SecretValue> value_;
    std::string filter_;
    std::string status_;

    std::optional<SelectionPath> restore_;
    std::optional<std::string> preferredSecret_;

    std::shared_ptr<concurrency::BulkLoad> warmLoad_;
    std::shared_ptr<concurrency::BulkLoad> groupLoad_;
    std::shared_ptr<bool> groupDone_;
    size_t pending_{0};
};

}
