#pragma once

#include <string>

namespace ferry::model {

enum class LocationKind { Host, DeviceStore, Ambiguous };

std::string to_string(LocationKind kind);

// Ambiguous never leaves the resolver; it is an error unless the caller overrides it.
struct Location {
    LocationKind kind = LocationKind::Host;
    std::string path;

    [[nodiscard]] bool isHost() const { return kind == LocationKind::Host; }
    [[nodiscard]] bool isDevice() const { return kind == LocationKind::DeviceStore; }

    bool operator==(const Location&) const = default;
};

}
