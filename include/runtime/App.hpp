#pragma once

#include "config/Config.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace lv::cli { class CommandRunner; class AzCli; }
namespace lv::auth { class CliTokenIssuer; class TokenCache; }
namespace lv::cache { class TTLCache; }
namespace lv::cloud { class AzureRestClient; class AzureSource; class ResourceFetcher; }
namespace lv::concurrency { class MainLoop; class ThreadPool; class BulkLoader; }
namespace lv::nav { class SelectionOrchestrator; }
namespace lv::shell { class Shell; }

namespace lv::runtime {

// Owns every service for one session. Members are declared in dependency order so that the pools
// join before the fetcher and caches they call into are destroyed.
class App {
public:
    App(const config::Config& config, std::string azPath, std::istream& in, std::ostream& out);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    int run();

    // Joins the worker pools; queued loads are dropped
    void stop();

    [[nodiscard]] cli::AzCli& az() const { return *az_; }

private:
    config::Config config_;

    std::unique_ptr<concurrency::MainLoop> loop_;
    std::unique_ptr<cli::CommandRunner> runner_;
    std::unique_ptr<cli::AzCli> az_;
    std::unique_ptr<auth::CliTokenIssuer> issuer_;
    std::unique_ptr<auth::TokenCache> tokens_;
    std::unique_ptr<cache::TTLCache> cache_;
    std::unique_ptr<cloud::AzureRestClient> rest_;
    std::unique_ptr<cloud::AzureSource> source_;
    std::unique_ptr<cloud::ResourceFetcher> fetcher_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::unique_ptr<concurrency::BulkLoader> bulk_;
    std::unique_ptr<nav::SelectionOrchestrator> orchestrator_;
    std::unique_ptr<shell::Shell> shell_;
};

}
