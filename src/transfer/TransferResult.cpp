#include "transfer/TransferResult.hpp"

#include <nlohmann/json.hpp>

namespace ferry::transfer {

std::string to_string(const TransferMode mode) {
    return mode == TransferMode::Move ? "move" : "copy";
}

void to_json(nlohmann::json& j, const TransferResult& r) {
    j = {
        {"name", r.name},
        {"final_name", r.finalName},
        {"ok", r.ok},
        {"staged", r.staged}
    };
    if (!r.ok) j["cause"] = r.cause;
}

}
