#include "cloud/Error.hpp"

#include <boost/algorithm/string/find.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <initializer_list>
#include <string_view>

namespace lv::cloud {

namespace {

bool containsAny(const std::string& text, const std::initializer_list<std::string_view> needles) {
    for (const auto& n : needles)
        if (!boost::algorithm::ifind_first(text, std::string(n)).empty()) return true;
    return false;
}

}

std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotAuthenticated: return "Not authenticated";
        case ErrorKind::AccessDenied: return "Access denied";
        case ErrorKind::NotFound: return "Not found";
        case ErrorKind::NetworkOrThrottling: return "Network or throttling";
        case ErrorKind::Unknown: return "Error";
    }
    return "Error";
}

ErrorKind classifyHttpStatus(const long status) {
    if (status == 0) return ErrorKind::NetworkOrThrottling;
    if (status == 401) return ErrorKind::NotAuthenticated;
    if (status == 403) return ErrorKind::AccessDenied;
    if (status == 404 || status == 410) return ErrorKind::NotFound;
    if (status == 408 || status == 429 || status / 100 == 5) return ErrorKind::NetworkOrThrottling;
    return ErrorKind::Unknown;
}

ErrorKind classifyCliMessage(const std::string& stderrText) {
    if (containsAny(stderrText, {"az login", "AADSTS", "not logged in", "expired"}))
        return ErrorKind::NotAuthenticated;
    if (containsAny(stderrText, {"AuthorizationFailed", "Forbidden", "does not have authorization"}))
        return ErrorKind::AccessDenied;
    if (containsAny(stderrText, {"ResourceNotFound", "NotFound", "could not be found", "was not found"}))
        return ErrorKind::NotFound;
    if (containsAny(stderrText, {"throttl", "TooManyRequests", "timed out", "Connection", "temporarily unavailable"}))
        return ErrorKind::NetworkOrThrottling;
    return ErrorKind::Unknown;
}

Error fromHttp(const long status, std::string message) {
    return {classifyHttpStatus(status), std::move(message)};
}

Error fromCli(std::string stderrText) {
    boost::algorithm::trim(stderrText);
    const auto kind = classifyCliMessage(stderrText);
    return {kind, std::move(stderrText)};
}

}
