#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ferry::storage {

enum class StorageType { Host, Device };

std::string to_string(StorageType type);

// A folder or item on one store. Children are resolved by name the way the
// store addresses them.
class Handle {
public:
    virtual ~Handle() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual bool isFolder() const = 0;

    // nullptr when no child of that name exists.
    [[nodiscard]] virtual std::shared_ptr<Handle> resolveChild(const std::string& name) const = 0;
    [[nodiscard]] virtual std::vector<std::shared_ptr<Handle>> enumerateChildren() const = 0;

    [[nodiscard]] virtual const std::filesystem::path& nativePath() const = 0;
    [[nodiscard]] virtual StorageType storage() const = 0;
};

// Shared base for stores that are reachable through a mounted directory tree.
class PathHandle : public Handle {
public:
    explicit PathHandle(std::filesystem::path path, std::string name = {});

    [[nodiscard]] std::string name() const override { return name_; }
    [[nodiscard]] bool isFolder() const override;
    [[nodiscard]] std::vector<std::shared_ptr<Handle>> enumerateChildren() const override;
    [[nodiscard]] const std::filesystem::path& nativePath() const override { return path_; }

protected:
    std::filesystem::path path_;
    std::string name_;

    [[nodiscard]] virtual std::shared_ptr<Handle> makeChild(const std::filesystem::path& path) const = 0;
};

class HostHandle final : public PathHandle {
public:
    using PathHandle::PathHandle;

    [[nodiscard]] std::shared_ptr<Handle> resolveChild(const std::string& name) const override;
    [[nodiscard]] StorageType storage() const override { return StorageType::Host; }

protected:
    [[nodiscard]] std::shared_ptr<Handle> makeChild(const std::filesystem::path& path) const override;
};

// Device namespaces are addressed by exact, case-sensitive child names and
// offer no direct lookup, so resolveChild() walks the folder's listing.
class DeviceHandle final : public PathHandle {
public:
    using PathHandle::PathHandle;

    [[nodiscard]] std::shared_ptr<Handle> resolveChild(const std::string& name) const override;
    [[nodiscard]] StorageType storage() const override { return StorageType::Device; }

protected:
    [[nodiscard]] std::shared_ptr<Handle> makeChild(const std::filesystem::path& path) const override;
};

}
