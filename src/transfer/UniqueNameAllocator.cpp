#include "transfer/UniqueNameAllocator.hpp"
#include "storage/Handle.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <unordered_set>

#include <fmt/format.h>

namespace ferry::transfer {

std::pair<std::string, std::string> UniqueNameAllocator::splitExtension(const std::string& name) {
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return {name, {}};
    return {name.substr(0, dot), name.substr(dot)};
}

std::string UniqueNameAllocator::allocate(const storage::Handle& folder, const std::string& candidate) {
    std::unordered_set<std::string> taken;
    for (const auto& child : folder.enumerateChildren()) taken.insert(child->name());

    if (!taken.contains(candidate)) return candidate;

    const auto [base, ext] = splitExtension(candidate);
    for (unsigned n = 1; n <= MAX_SUFFIX; ++n) {
        auto name = fmt::format("{} ({}){}", base, n, ext);
        if (!taken.contains(name)) {
            log::Registry::transfer()->debug("[UniqueNameAllocator] '{}' exists in {}, using '{}'",
                                             candidate, folder.name(), name);
            return name;
        }
    }

    throw Error(ErrorCode::NameSpaceExhausted,
                fmt::format("[UniqueNameAllocator] No free name for '{}' in {} after {} attempts",
                            candidate, folder.name(), MAX_SUFFIX));
}

}
