#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "bench_runner.h"
#include "common/configuration.h"

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("replibench", "Replicated key/value store benchmark client");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("c,config", "Configuration file (YAML or JSON)",
            cxxopts::value<std::string>()->default_value("config/client.yaml"))
        ("id", "Client id", cxxopts::value<int>())
        ("sr", "Start range of this client's unique keys", cxxopts::value<int>())
        ("saddr", "Server address", cxxopts::value<std::string>())
        ("sport", "Server port", cxxopts::value<int>())
        ("sp", "Separate batch types: a batch is all reads or all writes",
            cxxopts::value<bool>()->implicit_value("true"))
        ("algo", "Replication protocol: abd or epaxos", cxxopts::value<std::string>())
        ("record_results", "Record results in a csv file")
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    Replibench::Configuration configuration;
    const std::string config_file = result["config"].as<std::string>();
    // The default file is optional; an explicitly named one must load.
    if (result.count("config") || std::filesystem::exists(config_file)) {
        if (!configuration.loadFromFile(config_file)) {
            LOG(ERROR) << "Failed to load configuration from " << config_file;
            return 1;
        }
    } else {
        LOG(INFO) << "No configuration file at " << config_file << ", using defaults";
    }
    configuration.overrideFromCommandLine(result);

    if (!configuration.validate()) {
        for (const std::string& err : configuration.getValidationErrors()) {
            LOG(ERROR) << "Configuration error: " << err;
        }
        return 1;
    }

    try {
        const Replibench::RunParameters params = configuration.BuildRunParameters();
        Replibench::BenchRunner runner(params);
        runner.Run();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Benchmark run failed: " << e.what();
        return 1;
    }
    return 0;
}
