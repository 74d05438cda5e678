#include "runtime/TransferJob.hpp"
#include "runtime/Context.hpp"
#include "device/Selector.hpp"
#include "resolve/SourceResolver.hpp"
#include "resolve/WildcardMatcher.hpp"
#include "storage/DeviceEngine.hpp"
#include "storage/HostEngine.hpp"
#include "transfer/Stager.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

namespace ferry::runtime {

TransferJob::TransferJob(const config::Config& cfg, const device::Enumerator& enumerator,
                         std::filesystem::path workingDir)
    : cfg_(cfg), enumerator_(enumerator), workingDir_(std::move(workingDir)) {}

Report TransferJob::run(const Request& request) const {
    Report report;
    report.source = request.source;
    report.destination = request.destination;
    report.mode = request.mode;
    report.dryRun = request.dryRun;

    try {
        const auto device = device::select(enumerator_, request.deviceName);
        if (device) report.device = device->name;

        Context ctx(cfg_, enumerator_, device, request.dryRun, workingDir_);
        transferAll(ctx, request, report);

        const auto stats = ctx.waitForCleanup();
        report.cleanupDeleted = stats.deleted;
        report.cleanupTimedOut = stats.timedOut;
        report.settle();
    } catch (const Error& e) {
        report.status = Status::Failure;
        report.error = e.what();
        report.errorCode = to_string(e.code());
        log::Registry::ferry()->error("[TransferJob] {}: {}", to_string(e.code()), e.what());
        return report;
    } catch (const std::filesystem::filesystem_error& e) {
        report.status = Status::Failure;
        report.error = e.what();
        report.errorCode = "IOError";
        log::Registry::ferry()->error("[TransferJob] {}", e.what());
        return report;
    } catch (const std::exception& e) {
        report.status = Status::Failure;
        report.error = e.what();
        report.errorCode = "InternalError";
        log::Registry::ferry()->error("[TransferJob] {}", e.what());
        return report;
    }

    log::Registry::ferry()->info("[TransferJob] {}: {} matched, {} transferred, {} failed, {} folder(s) skipped, "
                                 "{} cleaned up, {} left locked",
                                 to_string(report.status), report.matched, report.transferred, report.failed,
                                 report.skippedFolders, report.cleanupDeleted, report.cleanupTimedOut);
    return report;
}

void TransferJob::transferAll(Context& ctx, const Request& request, Report& report) const {
    auto& resolver = ctx.resolver();

    const auto source = resolver.resolve(request.source, ctx.device().get(), request.patterns,
                                         request.skipAmbiguityCheck);
    const auto dest = resolver.resolveDestination(request.destination, ctx.device().get(),
                                                  request.skipAmbiguityCheck, request.createDestination);

    const auto sourceEngine = ctx.engineFor(source.directory.isDevice());
    const auto destEngine = ctx.engineFor(dest.isDevice());

    const auto sourceFolder = sourceEngine->getFolder(source.directory.path);
    if (!sourceFolder)
        throw Error(ErrorCode::NotFound, fmt::format("[TransferJob] Source folder '{}' vanished", source.directory.path));

    const auto destFolder = destEngine->getFolder(dest.path);
    if (!destFolder)
        throw Error(ErrorCode::NotFound, fmt::format("[TransferJob] Destination folder '{}' vanished", dest.path));

    const auto patterns = source.isFileMatch ? std::vector{source.filePattern}
                        : request.patterns.empty() ? std::vector<std::string>{"*"}
                        : request.patterns;
    const auto matcher = resolve::WildcardMatcher::compile(patterns);

    log::Registry::ferry()->info("[TransferJob] {} {}:{} -> {}:{}", transfer::to_string(request.mode),
                                 sourceEngine->displayName(), source.directory.path,
                                 destEngine->displayName(), dest.path);

    // Snapshot first: copying into the source folder itself must not feed the loop.
    const auto children = sourceFolder->enumerateChildren();

    for (const auto& child : children) {
        const auto name = child->name();
        if (!matcher.isMatch(name)) continue;
        ++report.matched;

        model::TransferItem item{name, sourceFolder, child, child->isFolder()};
        if (item.isFolder) {
            ++report.skippedFolders;
            log::Registry::transfer()->info("[TransferJob] Skipping folder {}", name);
            continue;
        }

        auto result = ctx.stager().transfer(item, sourceEngine, destEngine, destFolder, request.mode);
        if (result.ok) {
            ++report.transferred;
            if (result.renamed()) ++report.renamed;
        } else {
            ++report.failed;
        }
        report.items.push_back(std::move(result));
    }

    if (report.matched == 0)
        log::Registry::ferry()->warn("[TransferJob] Nothing in {} matches {}", source.directory.path, matcher.expression());
}

}
