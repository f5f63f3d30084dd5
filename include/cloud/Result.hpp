#pragma once

#include "cloud/Error.hpp"

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace lv::cloud {

// A fetched value or an explicit error, plus whether the value came from the cache.
// A value assembled from several sources may carry the error of the part that failed.
template <typename T>
class Result {
public:
    Result(T value, const bool fromCache = false, std::optional<Error> partialError = std::nullopt)
        : data_(std::move(value)), fromCache_(fromCache), partialError_(std::move(partialError)) {}
    Result(Error error) : data_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] bool fromCache() const { return fromCache_; }
    [[nodiscard]] const std::optional<Error>& partialError() const { return partialError_; }

    [[nodiscard]] const T& value() const {
        if (!ok()) throw std::logic_error("Result holds an error: " + std::get<Error>(data_).describe());
        return std::get<T>(data_);
    }

    T& value() {
        if (!ok()) throw std::logic_error("Result holds an error: " + std::get<Error>(data_).describe());
        return std::get<T>(data_);
    }

    [[nodiscard]] const Error& error() const {
        if (ok()) throw std::logic_error("Result holds a value, not an error");
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
    bool fromCache_{false};
    std::optional<Error> partialError_;
};

struct MutationResult {
    bool success{false};
    Error error;

    static MutationResult ok() { return {true, {}}; }
    static MutationResult failed(Error e) { return {false, std::move(e)}; }
};

}
