#include "shell/Shell.hpp"
#include "shell/Table.hpp"
#include "shell/Token.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>
#include <functional>
#include <iostream>

using namespace lv::shell;
using namespace lv::nav;
using namespace lv::logging;

namespace {

constexpr auto MASK = "********";

std::string marker(const std::optional<size_t>& selected, const size_t i) {
    return selected && *selected == i ? ">" : "";
}

std::optional<size_t> parseIndex(const std::string& s) {
    try {
        size_t pos = 0;
        const auto n = std::stoul(s, &pos);
        if (pos != s.size() || n == 0) return std::nullopt;
        return n - 1; // shown 1-based
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}

Shell::Shell(SelectionOrchestrator& orchestrator, concurrency::MainLoop& loop, const config::UiConfig& ui,
             std::istream& in, std::ostream& out)
    : orch_(orchestrator), loop_(loop), loadWait_(ui.load_wait_seconds), in_(in), out_(out) {
    orch_.setObserver(this);
    registerCommands();
}

Shell::~Shell() {
    orch_.setObserver(nullptr);
}

void Shell::registerCommands() {
    router_.registerCommand("accounts", {"a"}, "accounts", "List signed-in accounts",
                            [this](const CommandCall&) { return ok(renderAccounts()); });
    router_.registerCommand("subs", {"s", "subscriptions"}, "subs", "List subscriptions of the selected account",
                            [this](const CommandCall&) { return ok(renderSubscriptions()); });
    router_.registerCommand("res", {"r", "resources", "vaults"}, "res", "List Key Vaults and Container Apps",
                            [this](const CommandCall&) { return ok(renderResources()); });
    router_.registerCommand("secrets", {"ls"}, "secrets", "List secrets of the selected resource",
                            [this](const CommandCall&) { return ok(renderSecrets()); });
    router_.registerCommand("show", {"details"}, "show", "Show the selected secret",
                            [this](const CommandCall&) { return ok(renderDetails()); });
    router_.registerCommand("use", {"select"}, "use account|sub|res|secret <n>", "Select item <n> of a level",
                            [this](const CommandCall& c) { return use(c); });

    router_.registerCommand("filter", {"f", "/"}, "filter [text]", "Filter secrets by name; no text clears",
                            [this](const CommandCall& c) {
                                orch_.setFilter(restOfLine(c.line, 1));
                                return ok(renderSecrets());
                            });

    router_.registerCommand("reveal", {}, "reveal", "Show the selected value until it auto-hides",
                            [this](const CommandCall&) {
                                if (!orch_.reveal()) return failed("No secret value loaded");
                                return ok(renderDetails());
                            });
    router_.registerCommand("hide", {}, "hide", "Mask the selected value",
                            [this](const CommandCall&) {
                                orch_.hide();
                                return ok();
                            });
    router_.registerCommand("copy", {"c"}, "copy", "Print the raw value for piping",
                            [this](const CommandCall&) {
                                const auto v = orch_.copy();
                                if (!v) return failed("No secret value loaded");
                                return ok(*v + "\n");
                            });

    router_.registerCommand("set", {"edit"}, "set <value>", "Replace the selected secret's value",
                            [this](const CommandCall& c) {
                                const auto value = restOfLine(c.line, 1);
                                if (c.positionals.empty()) return invalid("usage: set <value>");
                                if (!orch_.editSelected(value)) return failed("No secret selected");
                                return ok();
                            });
    router_.registerCommand("new", {"create"}, "new <name> <value>", "Create a secret in the selected resource",
                            [this](const CommandCall& c) {
                                if (c.positionals.size() < 2) return invalid("usage: new <name> <value>");
                                if (!orch_.createSecret(c.positionals[0], restOfLine(c.line, 2)))
                                    return failed("No resource selected");
                                return ok();
                            });
    router_.registerCommand("rm", {"delete", "del"}, "rm", "Delete the selected secret (asks first)",
                            [this](const CommandCall&) { return remove(); });

    router_.registerCommand("refresh", {}, "refresh [force]", "Reload everything; force also drops caches and tokens",
                            [this](const CommandCall& c) {
                                const bool force = !c.positionals.empty() && c.positionals[0] == "force";
                                orch_.refresh(force);
                                return ok();
                            });
    router_.registerCommand("help", {"?", "h"}, "help", "Show this help",
                            [this](const CommandCall&) { return ok(router_.help()); });
    router_.registerCommand("quit", {"q", "exit"}, "quit", "Leave lazyvault",
                            [this](const CommandCall&) {
                                quit_ = true;
                                return ok();
                            });
}

int Shell::run() {
    LogRegistry::shell()->info("[Shell] Session started");
    orch_.start();
    pump();
    out_ << renderSecrets();

    std::string line;
    while (!quit_) {
        out_ << "lazyvault> " << std::flush;
        if (!std::getline(in_, line)) break;

        const auto result = execute(line);
        if (!result.out.empty()) out_ << result.out;
        if (!result.err.empty()) out_ << "error: " << result.err << "\n";
    }

    LogRegistry::shell()->info("[Shell] Session ended");
    return 0;
}

CommandResult Shell::execute(const std::string& line) {
    orch_.tick();
    auto result = router_.executeLine(boost::algorithm::trim_copy(line));
    pump();
    return result;
}

bool Shell::pump() {
    const bool settled = loop_.runUntil([this] { return orch_.isIdle(); }, loadWait_);
    if (!settled) out_ << "(still loading; results show up after the next command)\n";
    orch_.tick();
    return settled;
}

void Shell::onStatus(const std::string& message) {
    if (message == lastStatus_) return;
    lastStatus_ = message;
    out_ << "  " << message << "\n";
}

void Shell::onProgress(size_t, size_t, const std::string&) {
    // the orchestrator already phrases progress as status lines
}

void Shell::onMutation(const model::SecretMutation& mutation, const cloud::MutationResult& result) {
    LogRegistry::shell()->debug("[Shell] {} of '{}' finished: {}", to_string(mutation.kind), mutation.name,
                                result.success ? "ok" : result.error.describe());
}

CommandResult Shell::use(const CommandCall& call) {
    if (call.positionals.size() != 2) return invalid("usage: use account|sub|res|secret <n>");

    const auto level = boost::algorithm::to_lower_copy(call.positionals[0]);
    const auto i = parseIndex(call.positionals[1]);
    if (!i) return invalid("index must be a positive number");

    bool selected = false;
    std::function<std::string()> render;
    if (level == "account" || level == "a") {
        selected = orch_.selectAccount(*i);
        render = [this] { return renderSubscriptions(); };
    } else if (level == "sub" || level == "s" || level == "subscription") {
        selected = orch_.selectSubscription(*i);
        render = [this] { return renderResources(); };
    } else if (level == "res" || level == "r" || level == "resource") {
        selected = orch_.selectResource(*i);
        render = [this] { return renderSecrets(); };
    } else if (level == "secret" || level == "x") {
        selected = orch_.selectSecret(*i);
        render = [this] { return renderDetails(); };
    } else {
        return invalid("unknown level: " + call.positionals[0]);
    }

    if (!selected) return failed(fmt::format("no {} #{}", level, call.positionals[1]));
    pump();
    return ok(render());
}

CommandResult Shell::remove() {
    const auto secret = orch_.selectedSecret();
    const auto resource = orch_.selectedResource();
    if (!secret || !resource) return failed("No secret selected");

    out_ << fmt::format("Delete secret '{}' from {}? [y/N] ", secret->name, resource->name) << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) return ok("\n");
    boost::algorithm::trim(answer);
    if (answer != "y" && answer != "Y") return ok("Cancelled\n");

    orch_.deleteSelected();
    return ok();
}

std::string Shell::renderLevelState(const Level level) const {
    switch (orch_.state(level)) {
        case LevelState::Loading: return "  (loading...)\n";
        case LevelState::Failed: {
            std::string out;
            for (const auto& l : orch_.errorLines(level)) out += "  ! " + l + "\n";
            return out;
        }
        case LevelState::Idle: return "  (nothing selected)\n";
        case LevelState::Loaded: return {};
    }
    return {};
}

std::string Shell::renderAccounts() const {
    if (const auto s = renderLevelState(Level::Account); !s.empty()) return s;
    Table t({{" "}, {"#", Align::Right}, {"ACCOUNT"}});
    const auto sel = orch_.selected(Level::Account);
    for (size_t i = 0; i < orch_.owners().size(); ++i)
        t.add_row({marker(sel, i), std::to_string(i + 1), orch_.owners()[i]});
    return t.empty() ? "  (no accounts)\n" : t.render();
}

std::string Shell::renderSubscriptions() const {
    if (const auto s = renderLevelState(Level::Subscription); !s.empty()) return s;
    Table t({{" "}, {"#", Align::Right}, {"SUBSCRIPTION"}, {"ID", Align::Left, 8, 36}});
    const auto sel = orch_.selected(Level::Subscription);
    const auto& entries = orch_.subscriptions();
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (e.isHeader) t.add_row({marker(sel, i), std::to_string(i + 1), e.label + ":", fmt::format("({} subscriptions)", e.members.size())});
        else t.add_row({marker(sel, i), std::to_string(i + 1), (e.grouped ? "  " : "") + e.label, e.members.front().id});
    }
    return t.empty() ? "  (no subscriptions)\n" : t.render();
}

std::string Shell::renderResources() const {
    if (const auto s = renderLevelState(Level::Resource); !s.empty()) return s;
    Table t({{" "}, {"#", Align::Right}, {"TYPE"}, {"NAME"}, {"RESOURCE GROUP"}});
    const auto sel = orch_.selected(Level::Resource);
    const auto& resources = orch_.resources();
    for (size_t i = 0; i < resources.size(); ++i) {
        const auto& r = resources[i];
        t.add_row({marker(sel, i), std::to_string(i + 1), r.isKeyVault() ? "KV" : "CA", r.name, r.resourceGroup});
    }
    return t.empty() ? "  (no resources)\n" : t.render();
}

std::string Shell::renderSecrets() const {
    if (const auto s = renderLevelState(Level::Secret); !s.empty()) return s;
    Table t({{" "}, {"#", Align::Right}, {"SECRET"}, {"UPDATED"}});
    const auto sel = orch_.selected(Level::Secret);
    const auto& secrets = orch_.secrets();
    for (size_t i = 0; i < secrets.size(); ++i)
        t.add_row({marker(sel, i), std::to_string(i + 1), secrets[i].name, util::formatLocal(secrets[i].updated)});

    std::string out;
    if (!orch_.filter().empty())
        out += fmt::format("  filter '{}': {} of {}\n", orch_.filter(), secrets.size(), orch_.allSecrets().size());
    out += t.empty() ? "  (no secrets)\n" : t.render();
    return out;
}

std::string Shell::renderDetails() const {
    if (const auto s = renderLevelState(Level::Value); !s.empty()) return s;
    const auto& v = orch_.value();
    if (!v) return "  (no secret selected)\n";

    std::string out;
    out += fmt::format("  Name:     {}\n", v->name);
    out += fmt::format("  Value:    {}\n", orch_.isRevealed() ? v->value : MASK);
    out += fmt::format("  Created:  {}\n", util::formatLocal(v->created));
    out += fmt::format("  Updated:  {}\n", util::formatLocal(v->updated));
    out += fmt::format("  Expires:  {}\n", util::formatLocal(v->expires, "Never"));
    out += fmt::format("  Enabled:  {}\n", v->enabled ? (*v->enabled ? "yes" : "no") : "-");
    if (v->contentType && !v->contentType->empty()) out += fmt::format("  Type:     {}\n", *v->contentType);
    return out;
}
