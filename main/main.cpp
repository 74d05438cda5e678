#include "cli/Args.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "device/MountEnumerator.hpp"
#include "runtime/TransferJob.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <iostream>

#include <nlohmann/json.hpp>

using namespace ferry;

int main(const int argc, char** argv) {
    cli::Args args;
    try {
        args = cli::parse(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const Error& e) {
        std::cerr << "ferry: " << e.what() << "\n\n" << cli::usage();
        return runtime::exitCode(runtime::Status::Failure);
    }

    if (args.help) {
        std::cout << cli::usage();
        return EXIT_SUCCESS;
    }

    try {
        if (args.configPath) {
            if (!std::filesystem::exists(*args.configPath))
                throw Error(ErrorCode::NotFound, "Config file " + args.configPath->string() + " does not exist");
            paths::setConfigPath(*args.configPath);
        }
        config::ConfigRegistry::init(paths::getConfigPath());

        const auto& cfg = config::ConfigRegistry::get();
        if (args.printConfig) {
            std::cout << nlohmann::json(cfg).dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        log::Registry::init();
        log::Registry::ferry()->debug("[*] Using configuration {}", paths::getConfigPath().string());

        auto request = args.request;
        if (!args.skipAmbiguityCheckSet) request.skipAmbiguityCheck = cfg.resolve.skip_ambiguity_check;
        if (!args.createDestinationSet) request.createDestination = cfg.transfer.create_destination;

        const device::MountEnumerator enumerator(cfg.devices);
        const runtime::TransferJob job(cfg, enumerator);
        const auto report = job.run(request);

        if (args.json) std::cout << nlohmann::json(report).dump(2) << std::endl;
        else if (report.status == runtime::Status::Failure) std::cerr << "ferry: " << report.error << std::endl;

        spdlog::shutdown();
        return runtime::exitCode(report.status);
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::ferry()->error("[-] {}", e.what());
        else std::cerr << "ferry: " << e.what() << std::endl;
        return runtime::exitCode(runtime::Status::Failure);
    }
}
