#pragma once

#include "runtime/TransferJob.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::cli {

struct Args {
    runtime::Request request;
    std::optional<std::filesystem::path> configPath;
    bool skipAmbiguityCheckSet = false;
    bool createDestinationSet = false;
    bool json = false;
    bool printConfig = false;
    bool help = false;
};

// Throws ferry::Error(InvalidArgument) on unknown flags, missing values or a
// wrong number of positional arguments.
Args parse(const std::vector<std::string>& argv);

std::string usage();

}
