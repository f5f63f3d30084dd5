#include "cloud/AzureRestClient.hpp"
#include "auth/TokenError.hpp"
#include "logging/LogRegistry.hpp"
#include "util/curlWrappers.hpp"

#include <fmt/core.h>

using namespace lv::cloud;
using namespace lv::logging;
using json = nlohmann::json;

AzureRestClient::AzureRestClient(auth::TokenCache& tokens, const unsigned int timeoutSeconds)
    : tokens_(tokens), timeoutSeconds_(timeoutSeconds) {}

std::string AzureRestClient::errorMessage(const long status, const std::string& body) {
    const auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
        const auto& err = parsed["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
        if (err.is_string()) return err.get<std::string>();
    }
    if (body.empty()) return fmt::format("HTTP {}", status);
    return fmt::format("HTTP {}: {}", status, body.substr(0, 512));
}

Result<json> AzureRestClient::request(const std::string& method, const std::string& url, const std::string& tenantId,
                                      const std::string& scope, const std::string* body) {
    auth::Token token;
    try {
        token = tokens_.getToken(tenantId, scope);
    } catch (const auth::TokenError& e) {
        return e.error();
    }

    util::SList headers;
    headers.add("Authorization: Bearer " + token.accessToken);
    headers.add("Accept: application/json");
    if (body) headers.add("Content-Type: application/json");

    const auto res = util::performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
        if (body) {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        }
    });

    if (res.curl != CURLE_OK) {
        LogRegistry::cloud()->warn("[AzureRestClient] {} {} failed: {}", method, url, curl_easy_strerror(res.curl));
        return Error{ErrorKind::NetworkOrThrottling, curl_easy_strerror(res.curl)};
    }

    if (!res.ok()) {
        auto message = errorMessage(res.http, res.body);
        LogRegistry::cloud()->warn("[AzureRestClient] {} {} returned HTTP {}: {}", method, url, res.http, message);
        return fromHttp(res.http, std::move(message));
    }

    if (res.body.empty()) return json::object();
    auto parsed = json::parse(res.body, nullptr, false);
    if (parsed.is_discarded()) return Error{ErrorKind::Unknown, fmt::format("Unparsable response from {}", url)};
    return parsed;
}

Result<json> AzureRestClient::get(const std::string& url, const std::string& tenantId, const std::string& scope) {
    return request("GET", url, tenantId, scope, nullptr);
}

Result<json> AzureRestClient::post(const std::string& url, const std::string& tenantId, const std::string& scope,
                                   const std::string& body) {
    return request("POST", url, tenantId, scope, &body);
}

Result<json> AzureRestClient::put(const std::string& url, const std::string& tenantId, const std::string& scope,
                                  const std::string& body) {
    return request("PUT", url, tenantId, scope, &body);
}

Result<json> AzureRestClient::del(const std::string& url, const std::string& tenantId, const std::string& scope) {
    return request("DELETE", url, tenantId, scope, nullptr);
}

Result<std::vector<json>> AzureRestClient::getPaged(const std::string& url, const std::string& tenantId,
                                                    const std::string& scope) {
    std::vector<json> rows;
    std::string next = url;
    while (!next.empty()) {
        auto page = get(next, tenantId, scope);
        if (!page) return page.error();

        const auto& body = page.value();
        if (body.contains("value") && body["value"].is_array())
            for (const auto& row : body["value"]) rows.push_back(row);

        next = body.contains("nextLink") && body["nextLink"].is_string() ? body["nextLink"].get<std::string>() : "";
    }
    return rows;
}
