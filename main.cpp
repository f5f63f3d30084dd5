#include "cli/AzCli.hpp"
#include "cli/ProcessRunner.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "runtime/App.hpp"
#include "util/curlWrappers.hpp"
#include "util/paths.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#ifndef LAZYVAULT_VERSION
#define LAZYVAULT_VERSION "0.0.0"
#endif

using namespace lv;
using namespace lv::config;
using namespace lv::logging;

namespace {

struct Options {
    std::optional<std::string> configPath;
    std::optional<std::string> azPath;
    std::optional<std::string> logDir;
    bool version = false;
    bool help = false;
};

void usage(std::ostream& os) {
    os << "usage: lazyvault [--config <file>] [--az <path>] [--log-dir <dir>] [--version] [--help]\n";
}

// Returns false on a malformed command line
bool parseArgs(const int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") opts.help = true;
        else if (arg == "--version" || arg == "-V") opts.version = true;
        else if (arg == "--config" || arg == "-c") {
            if (!(opts.configPath = value())) return false;
        } else if (arg == "--az") {
            if (!(opts.azPath = value())) return false;
        } else if (arg == "--log-dir") {
            if (!(opts.logDir = value())) return false;
        } else {
            std::cerr << "lazyvault: unknown option '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

}

int main(int argc, char** argv) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        usage(std::cerr);
        return 2;
    }
    if (opts.help) {
        usage(std::cout);
        return EXIT_SUCCESS;
    }
    if (opts.version) {
        std::cout << "lazyvault " << LAZYVAULT_VERSION << "\n";
        return EXIT_SUCCESS;
    }

    try {
        if (opts.configPath) paths::setConfigPath(*opts.configPath);
        ConfigRegistry::init(paths::getConfigPath());

        const auto& config = ConfigRegistry::get();
        if (opts.logDir) paths::setLogDir(*opts.logDir);
        else if (!config.logging.log_dir.empty()) paths::setLogDir(config.logging.log_dir);
        LogRegistry::init(paths::getLogDir());

        LogRegistry::lazyvault()->info("[*] Starting lazyvault {}...", LAZYVAULT_VERSION);

        const auto azPath = cli::AzCli::locate(opts.azPath ? *opts.azPath : config.azure.cli_path);
        if (!azPath) {
            std::cerr << "lazyvault: Azure CLI not found. Install it from https://aka.ms/azure-cli\n";
            LogRegistry::lazyvault()->error("[-] Azure CLI not found");
            return EXIT_FAILURE;
        }

        {
            cli::ProcessRunner runner;
            cli::AzCli az(runner, *azPath);
            const auto version = az.version();
            if (!version) {
                std::cerr << "lazyvault: '" << *azPath << "' is not a working Azure CLI: "
                          << version.error().describe() << "\n";
                return EXIT_FAILURE;
            }
            LogRegistry::lazyvault()->info("[*] Using Azure CLI {} at {}", version.value(), *azPath);

            if (!az.isLoggedIn()) {
                std::cerr << "lazyvault: not signed in. Run 'az login' first.\n";
                LogRegistry::lazyvault()->error("[-] Azure CLI has no signed-in account");
                return EXIT_FAILURE;
            }
        }

        util::CurlGlobal curl;
        int rc;
        {
            runtime::App app(config, *azPath, std::cin, std::cout);
            rc = app.run();
        }

        LogRegistry::lazyvault()->info("[✓] lazyvault shut down cleanly.");
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "lazyvault: " << e.what() << "\n";
        if (LogRegistry::isInitialized()) LogRegistry::lazyvault()->error("[-] Fatal: {}", e.what());
        return EXIT_FAILURE;
    }
}
