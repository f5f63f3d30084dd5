#include "nav/SelectionOrchestrator.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <boost/algorithm/string/split.hpp>
#include <fmt/core.h>
#include <map>
#include <mutex>
#include <unordered_map>

using namespace lv::nav;
using namespace lv::cloud;
using namespace lv::model;
using namespace lv::logging;

SelectionOrchestrator::SelectionOrchestrator(ResourceFetcher& fetcher,
                                             auth::TokenCache& tokens,
                                             concurrency::ThreadPool& pool,
                                             concurrency::BulkLoader& bulk,
                                             concurrency::MainLoop& loop,
                                             const OrchestratorOptions options,
                                             const util::Clock& clock)
    : fetcher_(fetcher), tokens_(tokens), pool_(pool), bulk_(bulk), loop_(loop),
      options_(options), reveal_(options.revealTimeout, clock) {}

SelectionOrchestrator::~SelectionOrchestrator() {
    if (warmLoad_) warmLoad_->cancel();
    if (groupLoad_) groupLoad_->cancel();
}

// ---- staleness guard ----

LoadToken SelectionOrchestrator::currentToken(const Level level) const {
    return {level, generations_[index(level)]};
}

bool SelectionOrchestrator::applyIfCurrent(const LoadToken& token, const std::function<void()>& fn) {
    const auto current = generations_[index(token.level)];
    if (token.generation != current) {
        LogRegistry::nav()->debug("[SelectionOrchestrator] Dropping stale {} result (generation {} != {})",
                                  to_string(token.level), token.generation, current);
        return false;
    }
    fn();
    return true;
}

void SelectionOrchestrator::resetFrom(const Level from) {
    for (auto i = index(from); i < LEVEL_COUNT; ++i) {
        ++generations_[i];
        states_[i] = LevelState::Idle;
        errors_[i].reset();
        selected_[i].reset();

        switch (static_cast<Level>(i)) {
            case Level::Account:
                accounts_.clear();
                owners_.clear();
                break;
            case Level::Subscription:
                subscriptions_.clear();
                if (warmLoad_) warmLoad_->cancel();
                warmLoad_.reset();
                break;
            case Level::Resource:
                resources_.clear();
                if (groupLoad_) groupLoad_->cancel();
                if (groupDone_ && !*groupDone_) {
                    *groupDone_ = true;
                    finishPending();
                }
                groupLoad_.reset();
                groupDone_.reset();
                break;
            case Level::Secret:
                secrets_.clear();
                filteredSecrets_.clear();
                break;
            case Level::Value:
                value_.reset();
                reveal_.hide();
                break;
        }
        notifyLevel(static_cast<Level>(i));
    }
}

LoadToken SelectionOrchestrator::beginLoad(const Level level) {
    states_[index(level)] = LevelState::Loading;
    errors_[index(level)].reset();
    ++pending_;
    notifyLevel(level);
    return currentToken(level);
}

template <typename R>
void SelectionOrchestrator::dispatch(const Level level, std::function<R()> work, std::function<void(R&)> apply) {
    const auto token = beginLoad(level);
    const std::weak_ptr<bool> alive = alive_;
    auto& loop = loop_;

    try {
        pool_.submit([this, token, alive, &loop, work = std::move(work), apply = std::move(apply)] {
            auto result = std::make_shared<R>(work());
            loop.post([this, token, alive, result, apply] {
                if (!alive.lock()) return;
                finishPending();
                applyIfCurrent(token, [&] { apply(*result); });
            });
        }, "load:" + to_string(level));
    } catch (const std::exception& e) {
        finishPending();
        fail(level, {ErrorKind::Unknown, e.what()});
    }
}

void SelectionOrchestrator::finishPending() {
    if (pending_ > 0) --pending_;
}

// ---- levels ----

void SelectionOrchestrator::start() {
    resetFrom(Level::Account);
    loadAccounts();
}

void SelectionOrchestrator::loadAccounts() {
    if (const auto cached = fetcher_.cachedAccounts()) {
        applyAccounts(*cached, true);
        return;
    }

    setStatus("Loading accounts...");
    dispatch<Result<std::vector<Account>>>(
        Level::Account,
        [&fetcher = fetcher_] { return fetcher.accounts(); },
        [this](Result<std::vector<Account>>& r) {
            if (!r) return fail(Level::Account, r.error());
            applyAccounts(r.value(), r.fromCache());
        });
}

void SelectionOrchestrator::applyAccounts(const std::vector<Account>& accounts, const bool cached) {
    accounts_ = accounts;
    owners_ = uniqueOwners(accounts_);
    loaded(Level::Account);

    setStatus(fmt::format("{} {} accounts{}", restore_ ? "Refreshed" : "Loaded", owners_.size(),
                          cached ? " (cached)" : ""));

    if (const auto i = cascadeIndex(Level::Account, owners_.size())) selectAccount(*i);
}

bool SelectionOrchestrator::selectAccount(const size_t i) {
    if (i >= owners_.size()) return false;
    selected_[index(Level::Account)] = i;
    resetFrom(Level::Subscription);
    loadSubscriptions(owners_[i]);
    return true;
}

void SelectionOrchestrator::loadSubscriptions(const std::string& owner) {
    const auto subs = subscriptionsForOwner(accounts_, owner);
    subscriptions_ = buildSubscriptionEntries(subs);
    loaded(Level::Subscription);

    warmResources(subs);

    if (const auto i = cascadeIndex(Level::Subscription, subscriptions_.size())) selectSubscription(*i);
}

void SelectionOrchestrator::warmResources(const std::vector<Account>& subscriptions) {
    if (subscriptions.empty()) return;

    auto byId = std::make_shared<std::unordered_map<std::string, Account>>();
    std::vector<std::string> ids;
    for (const auto& s : subscriptions) {
        ids.push_back(s.id);
        byId->emplace(s.id, s);
    }

    auto& fetcher = fetcher_;
    warmLoad_ = bulk_.load(
        ids,
        [&fetcher](const std::string& id) { return fetcher.areResourcesCached(id); },
        [&fetcher, byId](const std::string& id) {
            // result lands in the cache; failures are retried by the foreground load
            if (const auto r = fetcher.resources(byId->at(id)); !r)
                LogRegistry::nav()->debug("[SelectionOrchestrator] Warm-up of {} failed: {}", id, r.error().describe());
        });

    const auto token = currentToken(Level::Subscription);
    const std::weak_ptr<concurrency::ProgressStream> weakStream = warmLoad_->progress();
    const std::weak_ptr<bool> alive = alive_;
    auto& loop = loop_;

    warmLoad_->progress()->setNotifier([this, weakStream, token, alive, byId, &loop] {
        loop.post([this, weakStream, token, alive, byId] {
            const auto stream = weakStream.lock();
            if (!alive.lock() || !stream) return;
            if (token.generation != generations_[index(Level::Subscription)]) return;

            while (const auto ev = stream->tryNext()) {
                if (ev->total == 0) continue;
                if (observer_) observer_->onProgress(ev->completed, ev->total, ev->currentId);

                // only worth reporting while the subscription in view is still waiting
                const auto sel = selected_[index(Level::Subscription)];
                if (!sel || *sel >= subscriptions_.size() || subscriptions_[*sel].isHeader) continue;
                if (fetcher_.areResourcesCached(subscriptions_[*sel].members.front().id)) continue;
                const auto it = byId->find(ev->currentId);
                setStatus(fmt::format("Loading resources ({}/{}): {}", ev->completed, ev->total,
                                      shortName(it == byId->end() ? ev->currentId : it->second.name)));
            }
        });
    });
}

bool SelectionOrchestrator::selectSubscription(const size_t i) {
    if (i >= subscriptions_.size()) return false;
    selected_[index(Level::Subscription)] = i;
    resetFrom(Level::Resource);

    const auto entry = subscriptions_[i];
    if (entry.isHeader) loadGroup(entry);
    else loadResources(entry);
    return true;
}

void SelectionOrchestrator::loadResources(const SubscriptionEntry& entry) {
    const auto sub = entry.members.front();

    if (auto cached = fetcher_.cachedResources(sub.id)) {
        applyResources(std::move(*cached), true);
        return;
    }

    setStatus(fmt::format("Loading resources: {}", shortName(sub.name)));
    dispatch<Result<std::vector<Resource>>>(
        Level::Resource,
        [&fetcher = fetcher_, sub] { return fetcher.resources(sub); },
        [this](Result<std::vector<Resource>>& r) {
            if (!r) return fail(Level::Resource, r.error());
            std::string warning;
            if (r.partialError()) warning = fmt::format("{} resources; {}", r.value().size(), r.partialError()->message);
            applyResources(std::move(r.value()), r.fromCache(), warning);
        });
}

void SelectionOrchestrator::loadGroup(const SubscriptionEntry& entry) {
    struct GroupResults {
        std::mutex mutex;
        std::map<std::string, Result<std::vector<Resource>>> byId;
    };

    const auto members = entry.members;
    auto results = std::make_shared<GroupResults>();
    auto byId = std::make_shared<std::unordered_map<std::string, Account>>();
    std::vector<std::string> ids;
    for (const auto& m : members) {
        ids.push_back(m.id);
        byId->emplace(m.id, m);
    }

    const auto token = beginLoad(Level::Resource);
    setStatus(fmt::format("Loading resources for {} subscriptions: {}", members.size(), shortName(entry.label)));

    auto& fetcher = fetcher_;
    groupLoad_ = bulk_.load(
        ids,
        // a cached member is captured now, so the merge below never has to read through the fetcher
        [&fetcher, results](const std::string& id) {
            auto cached = fetcher.cachedResources(id);
            if (!cached) return false;
            std::scoped_lock lock(results->mutex);
            results->byId.insert_or_assign(id, Result<std::vector<Resource>>(std::move(*cached), true));
            return true;
        },
        [&fetcher, results, byId](const std::string& id) {
            auto r = fetcher.resources(byId->at(id));
            std::scoped_lock lock(results->mutex);
            results->byId.insert_or_assign(id, std::move(r));
        });

    const auto merged = std::make_shared<bool>(false);
    groupDone_ = merged;
    const std::weak_ptr<concurrency::ProgressStream> weakStream = groupLoad_->progress();
    const std::weak_ptr<bool> alive = alive_;
    auto& loop = loop_;

    groupLoad_->progress()->setNotifier([this, weakStream, token, alive, results, byId, members, merged, &loop] {
        loop.post([this, weakStream, token, alive, results, byId, members, merged] {
            const auto stream = weakStream.lock();
            if (!alive.lock() || !stream || *merged) return;
            const bool current = token.generation == generations_[index(Level::Resource)];

            while (const auto ev = stream->tryNext()) {
                if (!current || ev->total == 0) continue;
                if (observer_) observer_->onProgress(ev->completed, ev->total, ev->currentId);
                const auto it = byId->find(ev->currentId);
                setStatus(fmt::format("Loading resources ({}/{}): {}", ev->completed, ev->total,
                                      shortName(it == byId->end() ? ev->currentId : it->second.name)));
            }

            if (!stream->isClosed()) return;
            *merged = true;
            finishPending();

            applyIfCurrent(token, [&] {
                std::vector<Resource> all;
                std::optional<Error> firstError;
                std::optional<Error> firstPartial;
                size_t failures = 0;
                bool allCached = true;

                for (const auto& m : members) {
                    std::optional<Result<std::vector<Resource>>> r;
                    {
                        std::scoped_lock lock(results->mutex);
                        if (const auto it = results->byId.find(m.id); it != results->byId.end()) r = it->second;
                    }
                    if (!r) r = Result<std::vector<Resource>>(Error{ErrorKind::Unknown, "Load of " + m.name + " did not run"});

                    if (!*r) {
                        ++failures;
                        if (!firstError) firstError = r->error();
                        continue;
                    }
                    if (r->partialError() && !firstPartial) firstPartial = r->partialError();
                    allCached = allCached && r->fromCache();
                    std::ranges::copy(r->value(), std::back_inserter(all));
                }

                if (failures == members.size() && firstError) return fail(Level::Resource, *firstError);

                sortResources(all);
                std::string warning;
                if (failures > 0)
                    warning = fmt::format("{} resources; {} of {} subscriptions failed: {}", all.size(), failures,
                                          members.size(), firstError->message);
                else if (firstPartial)
                    warning = fmt::format("{} resources; {}", all.size(), firstPartial->message);
                applyResources(std::move(all), allCached, warning);
            });
        });
    });
}

void SelectionOrchestrator::applyResources(std::vector<Resource> resources, const bool cached, const std::string& warning) {
    resources_ = std::move(resources);
    loaded(Level::Resource);

    if (!warning.empty()) {
        LogRegistry::nav()->warn("[SelectionOrchestrator] {}", warning);
        setStatus(warning);
    } else {
        setStatus(fmt::format("{} resources{}", resources_.size(), cached ? " (cached)" : ""));
    }

    if (const auto i = cascadeIndex(Level::Resource, resources_.size())) selectResource(*i);
}

bool SelectionOrchestrator::selectResource(const size_t i) {
    if (i >= resources_.size()) return false;
    selected_[index(Level::Resource)] = i;
    resetFrom(Level::Secret);
    loadSecrets(resources_[i]);
    return true;
}

void SelectionOrchestrator::loadSecrets(const Resource& resource) {
    if (auto cached = fetcher_.cachedSecrets(resource)) {
        applySecrets(std::move(*cached), true);
        return;
    }

    setStatus(fmt::format("Loading secrets: {}", shortName(resource.name)));
    dispatch<Result<std::vector<SecretMeta>>>(
        Level::Secret,
        [&fetcher = fetcher_, resource] { return fetcher.secrets(resource); },
        [this](Result<std::vector<SecretMeta>>& r) {
            if (!r) return fail(Level::Secret, r.error());
            applySecrets(std::move(r.value()), r.fromCache());
        });
}

void SelectionOrchestrator::applySecrets(std::vector<SecretMeta> secrets, const bool cached) {
    secrets_ = std::move(secrets);
    sortSecrets(secrets_);
    filteredSecrets_ = filterSecrets(secrets_, filter_);
    loaded(Level::Secret);
    setStatus(fmt::format("{} secrets{}", secrets_.size(), cached ? " (cached)" : ""));

    std::optional<size_t> pick;
    if (preferredSecret_) {
        const auto it = std::ranges::find(filteredSecrets_, *preferredSecret_, &SecretMeta::name);
        if (it != filteredSecrets_.end()) pick = static_cast<size_t>(it - filteredSecrets_.begin());
        preferredSecret_.reset();
    }
    if (!pick) pick = cascadeIndex(Level::Secret, filteredSecrets_.size());
    if (pick) selectSecret(*pick);
}

bool SelectionOrchestrator::selectSecret(const size_t i) {
    const auto resource = selectedResource();
    if (!resource || i >= filteredSecrets_.size()) return false;
    selected_[index(Level::Secret)] = i;
    resetFrom(Level::Value);
    loadValue(*resource, filteredSecrets_[i].name);
    return true;
}

void SelectionOrchestrator::loadValue(const Resource& resource, const std::string& name) {
    if (auto cached = fetcher_.cachedSecretValue(resource, name)) {
        value_ = std::move(*cached);
        loaded(Level::Value);
        return;
    }

    dispatch<Result<SecretValue>>(
        Level::Value,
        [&fetcher = fetcher_, resource, name] { return fetcher.secretValue(resource, name); },
        [this](Result<SecretValue>& r) {
            if (!r) return fail(Level::Value, r.error());
            value_ = std::move(r.value());
            loaded(Level::Value);
        });
}

void SelectionOrchestrator::fail(const Level level, const Error& err) {
    states_[index(level)] = LevelState::Failed;
    errors_[index(level)] = err;
    restore_.reset();
    LogRegistry::nav()->warn("[SelectionOrchestrator] Loading {} failed: {}", to_string(level), err.describe());
    setStatus(err.describe());
    notifyLevel(level);
}

void SelectionOrchestrator::loaded(const Level level) {
    states_[index(level)] = LevelState::Loaded;
    errors_[index(level)].reset();
    notifyLevel(level);
}

std::optional<size_t> SelectionOrchestrator::cascadeIndex(const Level level, const size_t count) {
    if (count == 0) {
        restore_.reset();
        return std::nullopt;
    }

    if (restore_) {
        std::optional<size_t>* saved = nullptr;
        switch (level) {
            case Level::Account: saved = &restore_->account; break;
            case Level::Subscription: saved = &restore_->subscription; break;
            case Level::Resource: saved = &restore_->resource; break;
            case Level::Secret: saved = &restore_->secret; break;
            case Level::Value: break;
        }

        const auto idx = saved ? *saved : std::nullopt;
        if (level == Level::Secret || !idx || *idx >= count) restore_.reset();
        else if (saved) saved->reset();
        if (idx && *idx < count) return idx;
    }

    if (level == Level::Subscription) {
        const auto it = std::ranges::find_if(subscriptions_, [](const SubscriptionEntry& e) { return !e.isHeader; });
        if (it == subscriptions_.end()) return std::nullopt;
        return static_cast<size_t>(it - subscriptions_.begin());
    }
    return 0;
}

// ---- filter / refresh ----

void SelectionOrchestrator::setFilter(const std::string& filter) {
    const auto previous = selectedSecret();
    filter_ = filter;
    if (states_[index(Level::Secret)] != LevelState::Loaded) return;

    filteredSecrets_ = filterSecrets(secrets_, filter_);
    notifyLevel(Level::Secret);

    if (previous) {
        const auto it = std::ranges::find(filteredSecrets_, previous->name, &SecretMeta::name);
        if (it != filteredSecrets_.end()) {
            selected_[index(Level::Secret)] = static_cast<size_t>(it - filteredSecrets_.begin());
            return;
        }
    }

    if (!filteredSecrets_.empty()) {
        selectSecret(0);
        return;
    }

    selected_[index(Level::Secret)].reset();
    resetFrom(Level::Value);
}

void SelectionOrchestrator::refresh(const bool force) {
    SelectionPath path;
    path.account = selected_[index(Level::Account)];
    path.subscription = selected_[index(Level::Subscription)];
    path.resource = selected_[index(Level::Resource)];
    path.secret = selected_[index(Level::Secret)];

    if (force) {
        fetcher_.clear();
        tokens_.clear();
        LogRegistry::nav()->info("[SelectionOrchestrator] Forced refresh: resource and token caches cleared");
    } else {
        fetcher_.invalidateAccounts();
    }

    setStatus("Refreshing all data...");
    restore_ = path;
    resetFrom(Level::Account);
    loadAccounts();
}

// ---- mutations ----

bool SelectionOrchestrator::mutate(SecretMutation mutation) {
    const std::weak_ptr<bool> alive = alive_;
    auto& loop = loop_;
    auto& fetcher = fetcher_;

    ++pending_;
    setStatus(fmt::format("{} '{}'...", mutation.kind == SecretMutation::Kind::Delete ? "Deleting" : "Saving",
                          mutation.name));

    try {
        pool_.submit([this, alive, &loop, &fetcher, mutation] {
            auto result = fetcher.apply(mutation);
            loop.post([this, alive, mutation, result] {
                if (!alive.lock()) return;
                finishPending();

                audit(fmt::format("{} {}", to_string(mutation.kind), result.success ? "ok" : "failed"),
                      mutation.resource, mutation.name);
                if (observer_) observer_->onMutation(mutation, result);

                if (!result.success) {
                    setStatus("Failed: " + result.error.message);
                    return;
                }

                switch (mutation.kind) {
                    case SecretMutation::Kind::Set: setStatus(fmt::format("Saved secret '{}'", mutation.name)); break;
                    case SecretMutation::Kind::Create: setStatus(fmt::format("Created secret '{}'", mutation.name)); break;
                    case SecretMutation::Kind::Delete: setStatus(fmt::format("Deleted secret '{}'", mutation.name)); break;
                }

                const auto current = selectedResource();
                if (!current || !(*current == mutation.resource)) return;

                if (mutation.kind != SecretMutation::Kind::Delete) preferredSecret_ = mutation.name;
                resetFrom(Level::Secret);
                loadSecrets(*current);
            });
        }, "mutate:" + mutation.name);
    } catch (const std::exception& e) {
        finishPending();
        setStatus(std::string("Failed: ") + e.what());
        return false;
    }
    return true;
}

bool SelectionOrchestrator::editSelected(const std::string& value) {
    const auto resource = selectedResource();
    const auto secret = selectedSecret();
    if (!resource || !secret) return false;
    return mutate(SecretMutation::set(*resource, secret->name, value));
}

bool SelectionOrchestrator::createSecret(const std::string& name, const std::string& value) {
    const auto resource = selectedResource();
    if (!resource || name.empty()) return false;
    return mutate(SecretMutation::create(*resource, name, value));
}

bool SelectionOrchestrator::deleteSelected() {
    const auto resource = selectedResource();
    const auto secret = selectedSecret();
    if (!resource || !secret) return false;
    return mutate(SecretMutation::remove(*resource, secret->name));
}

// ---- reveal / copy ----

std::string SelectionOrchestrator::revealKey() const {
    const auto resource = selectedResource();
    const auto secret = selectedSecret();
    if (!resource || !secret) return {};
    return resource->key() + ":" + secret->name;
}

std::optional<std::string> SelectionOrchestrator::reveal() {
    const auto resource = selectedResource();
    if (!value_ || !resource) return std::nullopt;
    reveal_.reveal(revealKey());
    audit("reveal", *resource, value_->name);
    setStatus(fmt::format("Revealed '{}' (hides in {}s)", value_->name, reveal_.timeout().count()));
    notifyLevel(Level::Value);
    return value_->value;
}

std::optional<std::string> SelectionOrchestrator::copy() {
    const auto resource = selectedResource();
    if (!value_ || !resource) return std::nullopt;
    audit("copy", *resource, value_->name);
    setStatus(fmt::format("Copied '{}'", value_->name));
    return value_->value;
}

void SelectionOrchestrator::hide() {
    reveal_.hide();
    notifyLevel(Level::Value);
}

bool SelectionOrchestrator::isRevealed() const {
    return value_ && reveal_.isRevealed(revealKey());
}

void SelectionOrchestrator::tick() {
    if (!reveal_.expire()) return;
    setStatus("Secret hidden");
    notifyLevel(Level::Value);
}

// ---- accessors / helpers ----

std::optional<Resource> SelectionOrchestrator::selectedResource() const {
    const auto i = selected_[index(Level::Resource)];
    if (!i || *i >= resources_.size()) return std::nullopt;
    return resources_[*i];
}

std::optional<SecretMeta> SelectionOrchestrator::selectedSecret() const {
    const auto i = selected_[index(Level::Secret)];
    if (!i || *i >= filteredSecrets_.size()) return std::nullopt;
    return filteredSecrets_[*i];
}

std::vector<std::string> SelectionOrchestrator::errorLines(const Level level) const {
    const auto& err = errors_[index(level)];
    if (!err) return {};

    std::vector<std::string> lines{to_string(err->kind)};
    std::vector<std::string> parts;
    boost::algorithm::split(parts, err->message, [](const char c) { return c == '\n'; });
    for (auto& p : parts)
        if (!p.empty()) lines.push_back(std::move(p));
    return lines;
}

void SelectionOrchestrator::setStatus(const std::string& message) {
    status_ = message;
    if (observer_) observer_->onStatus(message);
}

void SelectionOrchestrator::notifyLevel(const Level level) {
    if (observer_) observer_->onLevelChanged(level);
}

void SelectionOrchestrator::audit(const std::string& action, const Resource& resource, const std::string& name) const {
    LogRegistry::audit()->info("[{}] {} '{}' in {} ({})", action, to_string(resource.kind), name, resource.name,
                               resource.subscriptionId);
}

std::string SelectionOrchestrator::shortName(const std::string& name) const {
    if (name.size() <= options_.statusNameWidth) return name;
    return name.substr(0, options_.statusNameWidth) + "...";
}
