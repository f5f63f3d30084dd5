#include "shell/Router.hpp"
#include "shell/Table.hpp"
#include "shell/Token.hpp"
#include "logging/LogRegistry.hpp"

#include <cctype>
#include <fmt/core.h>

using namespace lv::shell;
using namespace lv::logging;

void Router::registerCommand(const std::string& name, std::vector<std::string> aliases, std::string usage,
                             std::string description, CommandHandler handler) {
    const std::string key = normalize(name);

    CommandInfo info{std::move(usage), description.empty() ? "No description provided." : std::move(description),
                     std::move(handler), {}};

    for (const auto& alias : aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.push_back(a);
        aliasMap_[a] = key;
    }

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

CommandResult Router::executeLine(const std::string& line) const {
    LogRegistry::shell()->debug("[Router] Executing line: '{}'", line.substr(0, line.find(' ')));

    auto words = tokenize(line);
    if (words.empty()) return ok();

    CommandCall call;
    call.name = canonicalFor(words.front());
    call.positionals.assign(words.begin() + 1, words.end());
    call.line = line;

    const auto it = commands_.find(call.name);
    if (it == commands_.end()) return invalid(fmt::format("Unknown command: {} (try 'help')", words.front()));

    try {
        return it->second.handler(call);
    } catch (const std::exception& e) {
        LogRegistry::shell()->error("[Router] Command '{}' failed: {}", call.name, e.what());
        return failed(e.what());
    }
}

std::string Router::help() const {
    Table t({{"COMMAND", Align::Left, 8, 40}, {"DESCRIPTION", Align::Left, 10, 80}});
    for (const auto& key : order_) {
        const auto& info = commands_.at(key);
        t.add_row({info.usage.empty() ? key : info.usage, info.description});
    }
    return t.render();
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
