#pragma once

#include "model/Resource.hpp"

#include <string>

namespace lv::model {

struct SecretMutation {
    enum class Kind { Set, Create, Delete };

    Kind kind{Kind::Set};
    Resource resource;
    std::string name;
    std::string value; // unused for Delete

    static SecretMutation set(Resource r, std::string n, std::string v) {
        return {Kind::Set, std::move(r), std::move(n), std::move(v)};
    }
    static SecretMutation create(Resource r, std::string n, std::string v) {
        return {Kind::Create, std::move(r), std::move(n), std::move(v)};
    }
    static SecretMutation remove(Resource r, std::string n) {
        return {Kind::Delete, std::move(r), std::move(n), {}};
    }
};

inline std::string to_string(const SecretMutation::Kind kind) {
    switch (kind) {
        case SecretMutation::Kind::Set: return "set";
        case SecretMutation::Kind::Create: return "create";
        case SecretMutation::Kind::Delete: return "delete";
    }
    return "unknown";
}

}
