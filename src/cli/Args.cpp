#include "cli/Args.hpp"
#include "error/Error.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>

namespace ferry::cli {

namespace {

// "--pattern=*.jpg" and "--pattern *.jpg" both work.
std::string takeValue(const std::vector<std::string>& argv, size_t& i, const std::string& flag) {
    const auto& arg = argv[i];
    if (const auto eq = arg.find('='); eq != std::string::npos && boost::algorithm::starts_with(arg, "--"))
        return arg.substr(eq + 1);

    if (i + 1 >= argv.size())
        throw Error(ErrorCode::InvalidArgument, fmt::format("{} needs a value", flag));
    return argv[++i];
}

std::string flagName(const std::string& arg) {
    const auto eq = arg.find('=');
    return boost::algorithm::starts_with(arg, "--") && eq != std::string::npos ? arg.substr(0, eq) : arg;
}

}

Args parse(const std::vector<std::string>& argv) {
    Args args;
    std::vector<std::string> positional;
    bool onlyPositional = false;

    for (size_t i = 0; i < argv.size(); ++i) {
        const auto& arg = argv[i];

        if (onlyPositional || arg.empty() || arg.front() != '-' || arg == "-") {
            positional.push_back(arg);
            continue;
        }

        const auto flag = flagName(arg);

        if (flag == "--") onlyPositional = true;
        else if (flag == "-h" || flag == "--help") args.help = true;
        else if (flag == "-p" || flag == "--pattern") args.request.patterns.push_back(takeValue(argv, i, flag));
        else if (flag == "--move") args.request.mode = transfer::TransferMode::Move;
        else if (flag == "--device") args.request.deviceName = takeValue(argv, i, flag);
        else if (flag == "--skip-ambiguity-check") args.request.skipAmbiguityCheck = args.skipAmbiguityCheckSet = true;
        else if (flag == "--create-destination") args.request.createDestination = args.createDestinationSet = true;
        else if (flag == "--dry-run") args.request.dryRun = true;
        else if (flag == "--json") args.json = true;
        else if (flag == "--config") args.configPath = takeValue(argv, i, flag);
        else if (flag == "--print-config") args.printConfig = true;
        else throw Error(ErrorCode::InvalidArgument, fmt::format("Unknown option '{}'", arg));
    }

    if (args.help || args.printConfig) {
        if (!positional.empty() && positional.size() != 2)
            throw Error(ErrorCode::InvalidArgument, "Expected <source> <destination>");
    } else if (positional.size() != 2) {
        throw Error(ErrorCode::InvalidArgument,
                    fmt::format("Expected <source> <destination>, got {} argument(s)", positional.size()));
    }

    if (positional.size() == 2) {
        args.request.source = positional[0];
        args.request.destination = positional[1];
    }

    return args;
}

std::string usage() {
    return
        "Usage: ferry <source> <destination> [options]\n"
        "\n"
        "Copy (or move) files between the host and an attached device.\n"
        "<source> may end in a file name or a wildcard: 'Internal storage/DCIM/Camera/*.jpg'\n"
        "\n"
        "Options:\n"
        "  -p, --pattern GLOB        only transfer names matching GLOB (repeatable)\n"
        "      --move                delete sources once they reached the destination\n"
        "      --device NAME         device to use when more than one is attached\n"
        "      --skip-ambiguity-check  treat paths that exist on both sides as device paths\n"
        "      --create-destination  create missing destination folders\n"
        "      --dry-run             show what would be transferred\n"
        "      --json                print the run report as JSON\n"
        "      --config PATH         configuration file\n"
        "      --print-config        print the effective configuration as JSON\n"
        "  -h, --help                this text\n";
}

}
