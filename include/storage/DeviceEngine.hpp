#pragma once

#include "storage/Engine.hpp"
#include "device/Device.hpp"

namespace ferry::storage {

// Folder provider over a mounted device namespace. Location paths are
// relative to the device root and use forward slashes only.
class DeviceEngine final : public Engine {
public:
    explicit DeviceEngine(device::Device device);

    [[nodiscard]] StorageType type() const override { return StorageType::Device; }
    [[nodiscard]] std::string displayName() const override { return device_.name; }

    [[nodiscard]] std::shared_ptr<Handle> root() const;

    [[nodiscard]] std::shared_ptr<Handle> getFolder(const std::string& path) const override;
    std::shared_ptr<Handle> createFolder(const Handle& parent, const std::string& name) override;
    std::shared_ptr<Handle> copyInto(const Handle& folder, const Handle& item, const std::string& asName = {}) override;
    std::shared_ptr<Handle> moveInto(const Handle& folder, const Handle& item, const std::string& asName = {}) override;
    bool remove(const Handle& folder, const std::string& name) override;

    [[nodiscard]] const device::Device& device() const { return device_; }

private:
    device::Device device_;
};

}
