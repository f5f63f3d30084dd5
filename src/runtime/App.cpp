#include "runtime/App.hpp"
#include "auth/CliTokenIssuer.hpp"
#include "auth/TokenCache.hpp"
#include "cache/TTLCache.hpp"
#include "cli/AzCli.hpp"
#include "cli/ProcessRunner.hpp"
#include "cloud/AzureRestClient.hpp"
#include "cloud/AzureSource.hpp"
#include "cloud/ResourceFetcher.hpp"
#include "concurrency/BulkLoader.hpp"
#include "concurrency/MainLoop.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"
#include "nav/SelectionOrchestrator.hpp"
#include "shell/Shell.hpp"

using namespace lv::runtime;
using namespace lv::logging;

App::App(const config::Config& config, std::string azPath, std::istream& in, std::ostream& out)
    : config_(config) {
    LogRegistry::lazyvault()->debug("[App] Wiring services...");

    loop_ = std::make_unique<concurrency::MainLoop>();
    runner_ = std::make_unique<cli::ProcessRunner>();
    az_ = std::make_unique<cli::AzCli>(*runner_, std::move(azPath));
    issuer_ = std::make_unique<auth::CliTokenIssuer>(*az_);
    tokens_ = std::make_unique<auth::TokenCache>(
        *issuer_, std::chrono::minutes(config_.auth.token_refresh_margin_minutes));
    cache_ = std::make_unique<cache::TTLCache>(
        std::chrono::duration_cast<cache::TTLCache::Duration>(config_.cache.default_ttl));
    rest_ = std::make_unique<cloud::AzureRestClient>(*tokens_, config_.azure.request_timeout_seconds);
    source_ = std::make_unique<cloud::AzureSource>(*az_, *rest_, config_.azure);
    fetcher_ = std::make_unique<cloud::ResourceFetcher>(*cache_, *source_);
    pool_ = std::make_unique<concurrency::ThreadPool>(config_.ui.worker_threads, "loader");
    bulk_ = std::make_unique<concurrency::BulkLoader>(config_.cache.bulk_concurrency);

    nav::OrchestratorOptions options;
    options.revealTimeout = std::chrono::seconds(config_.ui.reveal_timeout_seconds);
    options.statusNameWidth = config_.ui.status_name_width;
    orchestrator_ = std::make_unique<nav::SelectionOrchestrator>(*fetcher_, *tokens_, *pool_, *bulk_, *loop_, options);

    shell_ = std::make_unique<shell::Shell>(*orchestrator_, *loop_, config_.ui, in, out);

    LogRegistry::lazyvault()->info("[App] Ready ({} workers, bulk concurrency {})",
                                   config_.ui.worker_threads, config_.cache.bulk_concurrency);
}

App::~App() {
    stop();
}

int App::run() {
    return shell_->run();
}

void App::stop() {
    if (pool_ && !pool_->isStopped()) {
        LogRegistry::lazyvault()->debug("[App] Stopping worker pools...");
        pool_->stop();
    }
    if (bulk_) bulk_->stop();
}
