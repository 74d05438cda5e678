#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ferry::transfer {

enum class TransferMode { Copy, Move };

std::string to_string(TransferMode mode);

struct TransferResult {
    std::string name;
    std::string finalName;    // name at the destination, may carry a " (n)" suffix
    bool ok = false;
    bool staged = false;
    std::string cause;        // set when !ok

    [[nodiscard]] bool renamed() const { return ok && finalName != name; }
};

void to_json(nlohmann::json& j, const TransferResult& r);

}
