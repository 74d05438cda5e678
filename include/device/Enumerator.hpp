#pragma once

#include "device/Device.hpp"

#include <string>
#include <vector>

namespace ferry::device {

class Enumerator {
public:
    virtual ~Enumerator() = default;

    [[nodiscard]] virtual std::vector<Device> list() const = 0;

    // Names of the folders directly under the device root, sorted.
    [[nodiscard]] virtual std::vector<std::string> topLevelFolders(const Device& device) const;
};

}
