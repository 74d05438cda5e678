#pragma once

#include "storage/Engine.hpp"

#include <filesystem>

namespace ferry::storage {

class HostEngine final : public Engine {
public:
    // Relative location paths resolve against workingDir (current directory when empty).
    explicit HostEngine(std::filesystem::path workingDir = {});

    [[nodiscard]] StorageType type() const override { return StorageType::Host; }
    [[nodiscard]] std::string displayName() const override { return "host"; }

    [[nodiscard]] std::shared_ptr<Handle> getFolder(const std::string& path) const override;
    std::shared_ptr<Handle> createFolder(const Handle& parent, const std::string& name) override;
    std::shared_ptr<Handle> copyInto(const Handle& folder, const Handle& item, const std::string& asName = {}) override;
    std::shared_ptr<Handle> moveInto(const Handle& folder, const Handle& item, const std::string& asName = {}) override;
    bool remove(const Handle& folder, const std::string& name) override;

    // Host filesystem primitives, all taking location paths ("~" expanded, relative to workingDir).
    [[nodiscard]] std::filesystem::path absolute(const std::string& path) const;
    [[nodiscard]] bool exists(const std::string& path) const;
    [[nodiscard]] bool isDirectory(const std::string& path) const;
    void createDirectories(const std::string& path) const;
    void move(const std::filesystem::path& from, const std::filesystem::path& to) const;
    void copy(const std::filesystem::path& from, const std::filesystem::path& to) const;
    void rename(const std::filesystem::path& from, const std::filesystem::path& to) const;
    bool removeFile(const std::filesystem::path& path) const;

    [[nodiscard]] const std::filesystem::path& workingDir() const { return workingDir_; }

private:
    std::filesystem::path workingDir_;
};

}
