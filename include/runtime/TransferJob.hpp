#pragma once

#include "runtime/Report.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::device {
class Enumerator;
}

namespace ferry::runtime {

class Context;

struct Request {
    std::string source;
    std::string destination;
    std::vector<std::string> patterns;
    transfer::TransferMode mode = transfer::TransferMode::Copy;
    std::string deviceName;
    bool skipAmbiguityCheck = false;
    bool createDestination = false;
    bool dryRun = false;
};

// One end-to-end run: pick the device, resolve both paths, transfer every
// match, wait for cleanup, report. Resolution problems end up in the report
// as Failure rather than escaping.
class TransferJob {
public:
    TransferJob(const config::Config& cfg, const device::Enumerator& enumerator,
                std::filesystem::path workingDir = {});

    Report run(const Request& request) const;

private:
    config::Config cfg_;
    const device::Enumerator& enumerator_;
    std::filesystem::path workingDir_;

    void transferAll(Context& ctx, const Request& request, Report& report) const;
};

}
