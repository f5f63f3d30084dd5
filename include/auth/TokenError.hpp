#pragma once

#include "cloud/Error.hpp"

#include <stdexcept>

namespace lv::auth {

class TokenError : public std::runtime_error {
public:
    explicit TokenError(cloud::Error error)
        : std::runtime_error(error.describe()), error_(std::move(error)) {}

    [[nodiscard]] const cloud::Error& error() const { return error_; }

private:
    cloud::Error error_;
};

}
