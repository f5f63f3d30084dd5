#pragma once

#include <string>
#include <vector>

namespace lv::cli {

struct CommandResult {
    int exitCode{-1};
    std::string out;
    std::string err;

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // argv[0] is the program; nothing is interpreted by a shell
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

}
