#include "runtime/Report.hpp"

#include <nlohmann/json.hpp>

namespace ferry::runtime {

std::string to_string(const Status status) {
    switch (status) {
        case Status::Success: return "success";
        case Status::Warning: return "warning";
        case Status::Failure: return "failure";
        default: return "unknown";
    }
}

int exitCode(const Status status) {
    switch (status) {
        case Status::Success: return 0;
        case Status::Warning: return 1;
        default: return 2;
    }
}

void Report::settle() {
    if (status == Status::Failure) return;
    status = transferred == 0 || failed > 0 || cleanupTimedOut > 0 ? Status::Warning : Status::Success;
}

void to_json(nlohmann::json& j, const Report& r) {
    j = {
        {"status", to_string(r.status)},
        {"source", r.source},
        {"destination", r.destination},
        {"mode", transfer::to_string(r.mode)},
        {"dry_run", r.dryRun},
        {"matched", r.matched},
        {"transferred", r.transferred},
        {"failed", r.failed},
        {"skipped_folders", r.skippedFolders},
        {"renamed", r.renamed},
        {"cleanup", {{"deleted", r.cleanupDeleted}, {"timed_out", r.cleanupTimedOut}}},
        {"items", r.items}
    };

    if (!r.device.empty()) j["device"] = r.device;
    if (r.errorCode) j["error"] = {{"code", *r.errorCode}, {"message", r.error}};
}

}
