#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lv::shell {

struct CommandCall {
    std::string name;
    std::vector<std::string> positionals;
    std::string line;  // raw input, for commands that take free text
};

struct CommandResult {
    int code{0};
    std::string out;
    std::string err;
};

inline CommandResult ok(std::string out = {}) { return {0, std::move(out), {}}; }
inline CommandResult invalid(std::string err) { return {2, {}, std::move(err)}; }
inline CommandResult failed(std::string err) { return {1, {}, std::move(err)}; }

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;
    std::string description;
    CommandHandler handler;
    std::vector<std::string> aliases;
};

class Router {
public:
    void registerCommand(const std::string& name, std::vector<std::string> aliases, std::string usage,
                         std::string description, CommandHandler handler);

    [[nodiscard]] CommandResult executeLine(const std::string& line) const;

    // One line per command, in registration order
    [[nodiscard]] std::string help() const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<std::string> order_;

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
