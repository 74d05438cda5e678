#pragma once

#include "transfer/TransferResult.hpp"
#include "model/TransferItem.hpp"

#include <memory>

namespace ferry::storage {
class Engine;
class HostEngine;
class Handle;
}

namespace ferry::cleanup {
class Coordinator;
}

namespace ferry::transfer {

class StagingArea;

// Moves or copies one item at a time.
//
// Host to host goes straight to the destination. Anything touching a device
// is copied into the staging area first, renamed there if the destination
// already has that name, then copied into the destination. A staged Move
// hands both the source and the staged copy to the cleanup coordinator, since
// the destination store may still be reading the staged bytes.
class Stager {
public:
    Stager(std::shared_ptr<storage::HostEngine> host, StagingArea& staging,
           cleanup::Coordinator& cleanup, bool dryRun = false);

    // Never throws for per-item problems; they come back as !ok with a cause.
    TransferResult transfer(const model::TransferItem& item,
                            const std::shared_ptr<storage::Engine>& sourceEngine,
                            const std::shared_ptr<storage::Engine>& destEngine,
                            const std::shared_ptr<storage::Handle>& destFolder,
                            TransferMode mode);

    [[nodiscard]] bool dryRun() const { return dryRun_; }

private:
    std::shared_ptr<storage::HostEngine> host_;
    StagingArea& staging_;
    cleanup::Coordinator& cleanup_;
    bool dryRun_;

    void transferDirect(const model::TransferItem& item, const storage::Handle& destFolder,
                        const std::string& finalName, TransferMode mode);

    void transferStaged(const model::TransferItem& item,
                        const std::shared_ptr<storage::Engine>& sourceEngine,
                        storage::Engine& destEngine, const storage::Handle& destFolder,
                        const std::string& finalName, TransferMode mode);
};

}
