#pragma once

#include "concurrency/MainLoop.hpp"
#include "config/Config.hpp"
#include "nav/SelectionObserver.hpp"
#include "nav/SelectionOrchestrator.hpp"
#include "shell/Router.hpp"

#include <chrono>
#include <iosfwd>
#include <string>

namespace lv::shell {

// Line-oriented front-end. The thread calling run() is the UI thread: it pumps the MainLoop after
// every command until the orchestrator settles.
class Shell final : public nav::SelectionObserver {
public:
    Shell(nav::SelectionOrchestrator& orchestrator, concurrency::MainLoop& loop, const config::UiConfig& ui,
          std::istream& in, std::ostream& out);

    ~Shell() override;

    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    // Runs until `quit` or end of input; returns the process exit code
    int run();

    CommandResult execute(const std::string& line);

    // Applies pending completions until idle or the load wait elapses; false on timeout
    bool pump();

    [[nodiscard]] bool quitRequested() const { return quit_; }

    void onStatus(const std::string& message) override;
    void onProgress(size_t completed, size_t total, const std::string& currentId) override;
    void onMutation(const model::SecretMutation& mutation, const cloud::MutationResult& result) override;

    [[nodiscard]] std::string renderAccounts() const;
    [[nodiscard]] std::string renderSubscriptions() const;
    [[nodiscard]] std::string renderResources() const;
    [[nodiscard]] std::string renderSecrets() const;
    [[nodiscard]] std::string renderDetails() const;

private:
    void registerCommands();
    CommandResult use(const CommandCall& call);
    CommandResult remove();
    [[nodiscard]] std::string renderLevelState(nav::Level level) const;

    nav::SelectionOrchestrator& orch_;
    concurrency::MainLoop& loop_;
    std::chrono::seconds loadWait_;
    std::istream& in_;
    std::ostream& out_;
    Router router_;
    std::string lastStatus_;
    bool quit_{false};
};

}
