#pragma once

#include "cli/CommandRunner.hpp"

namespace lv::cli {

// fork + execvp with stdout and stderr captured through pipes
class ProcessRunner final : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv) override;
};

}
