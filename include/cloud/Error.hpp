#pragma once

#include <string>

namespace lv::cloud {

enum class ErrorKind { NotAuthenticated, AccessDenied, NotFound, NetworkOrThrottling, Unknown };

std::string to_string(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::Unknown};
    std::string message;

    [[nodiscard]] std::string describe() const { return to_string(kind) + ": " + message; }
};

// HTTP status (0 for a transport failure) to error kind
ErrorKind classifyHttpStatus(long status);

// `az` stderr text to error kind
ErrorKind classifyCliMessage(const std::string& stderrText);

Error fromHttp(long status, std::string message);
Error fromCli(std::string stderrText);

}
