#include "device/Selector.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ferry::device {

std::optional<Device> select(const Enumerator& enumerator, const std::string& requested) {
    const auto devices = enumerator.list();

    if (!requested.empty()) {
        for (const auto& d : devices) {
            if (boost::algorithm::iequals(d.name, requested) || boost::algorithm::iequals(d.id, requested)) {
                log::Registry::device()->info("[Selector] Using device '{}'", d.name);
                return d;
            }
        }
        throw Error(ErrorCode::NotFound, fmt::format("[Selector] No attached device named '{}'", requested));
    }

    if (devices.empty()) {
        log::Registry::device()->debug("[Selector] No device attached, host paths only");
        return std::nullopt;
    }

    if (devices.size() == 1) {
        log::Registry::device()->info("[Selector] Using device '{}'", devices.front().name);
        return devices.front();
    }

    std::vector<std::string> names;
    for (const auto& d : devices) names.push_back(d.name);
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("[Selector] {} devices attached ({}), pick one with --device",
                            devices.size(), fmt::join(names, ", ")));
}

}
