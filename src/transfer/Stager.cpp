#include "transfer/Stager.hpp"
#include "transfer/StagingArea.hpp"
#include "transfer/UniqueNameAllocator.hpp"
#include "cleanup/Coordinator.hpp"
#include "storage/HostEngine.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

namespace ferry::transfer {

Stager::Stager(std::shared_ptr<storage::HostEngine> host, StagingArea& staging,
               cleanup::Coordinator& cleanup, const bool dryRun)
    : host_(std::move(host)), staging_(staging), cleanup_(cleanup), dryRun_(dryRun) {}

TransferResult Stager::transfer(const model::TransferItem& item,
                                const std::shared_ptr<storage::Engine>& sourceEngine,
                                const std::shared_ptr<storage::Engine>& destEngine,
                                const std::shared_ptr<storage::Handle>& destFolder,
                                const TransferMode mode) {
    TransferResult result{item.name, item.name};
    result.staged = sourceEngine->type() == storage::StorageType::Device ||
                    destEngine->type() == storage::StorageType::Device;

    try {
        if (item.isFolder)
            throw Error(ErrorCode::TransferFailed, "folders are not transferred");

        result.finalName = UniqueNameAllocator::allocate(*destFolder, item.name);

        if (dryRun_) {
            log::Registry::transfer()->info("[Stager] Would {} {} -> {}/{}", to_string(mode), item.name,
                                            destFolder->name(), result.finalName);
            result.ok = true;
            return result;
        }

        if (result.staged) transferStaged(item, sourceEngine, *destEngine, *destFolder, result.finalName, mode);
        else transferDirect(item, *destFolder, result.finalName, mode);

        result.ok = true;
        if (result.renamed())
            log::Registry::transfer()->info("[Stager] {} {} -> {}/{} (renamed)", to_string(mode), item.name,
                                            destFolder->name(), result.finalName);
        else
            log::Registry::transfer()->info("[Stager] {} {} -> {}", to_string(mode), item.name, destFolder->name());
    } catch (const std::exception& e) {
        result.ok = false;
        result.cause = e.what();
        log::Registry::transfer()->error("[Stager] {}: {}: {}", to_string(ErrorCode::TransferFailed), item.name, e.what());
    }

    return result;
}

void Stager::transferDirect(const model::TransferItem& item, const storage::Handle& destFolder,
                            const std::string& finalName, const TransferMode mode) {
    if (mode == TransferMode::Move) host_->moveInto(destFolder, *item.item, finalName);
    else host_->copyInto(destFolder, *item.item, finalName);
}

void Stager::transferStaged(const model::TransferItem& item,
                            const std::shared_ptr<storage::Engine>& sourceEngine,
                            storage::Engine& destEngine, const storage::Handle& destFolder,
                            const std::string& finalName, const TransferMode mode) {
    const auto slot = std::make_shared<storage::HostHandle>(staging_.newSlot());

    auto staged = host_->copyInto(*slot, *item.item);
    log::Registry::transfer()->debug("[Stager] Staged {} at {}", item.name, staged->nativePath().string());

    if (finalName != item.name) {
        const auto renamed = slot->nativePath() / finalName;
        host_->rename(staged->nativePath(), renamed);
        staged = std::make_shared<storage::HostHandle>(renamed);
    }

    destEngine.copyInto(destFolder, *staged);

    if (mode == TransferMode::Move) {
        cleanup_.enqueue(sourceEngine, item.folder, item.name);
        cleanup_.enqueue(host_, slot, staged->name());
    }
}

}
