#pragma once

#include "device/Device.hpp"
#include "device/Enumerator.hpp"

#include <optional>
#include <string>

namespace ferry::device {

// Picks the device a run targets. A requested name must match a device's
// display name or mount id (case-insensitive) or the call throws NotFound.
// Without a name: one device is used, none means host-only, several throw
// InvalidArgument.
std::optional<Device> select(const Enumerator& enumerator, const std::string& requested = {});

}
