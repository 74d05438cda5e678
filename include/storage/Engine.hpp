#pragma once

#include "storage/Handle.hpp"

#include <memory>
#include <string>

namespace ferry::storage {

// Folder provider for one store. Items may come from any store; engines copy
// them through their native path.
class Engine : public std::enable_shared_from_this<Engine> {
public:
    virtual ~Engine() = default;

    [[nodiscard]] virtual StorageType type() const = 0;

    // Folder at a location path on this store, nullptr when it is missing or not a folder.
    [[nodiscard]] virtual std::shared_ptr<Handle> getFolder(const std::string& path) const = 0;

    virtual std::shared_ptr<Handle> createFolder(const Handle& parent, const std::string& name) = 0;

    // Both place item inside folder as asName (item.name() when empty) and
    // return the new handle. An existing target is never overwritten.
    virtual std::shared_ptr<Handle> copyInto(const Handle& folder, const Handle& item, const std::string& asName = {}) = 0;
    virtual std::shared_ptr<Handle> moveInto(const Handle& folder, const Handle& item, const std::string& asName = {}) = 0;

    // False while the file is still held open by someone else. A name that is
    // already gone counts as removed.
    virtual bool remove(const Handle& folder, const std::string& name) = 0;

    [[nodiscard]] virtual std::string displayName() const = 0;
};

}
