#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Replibench {

namespace {

// Reads the first of `keys` present in `node` into `value`. The benchmark
// section accepts both the snake_case names and the short names used by the
// replica's config.json ("T", "K", "W", ...).
template<typename T>
void SetIfPresent(const YAML::Node& node, std::initializer_list<const char*> keys, ConfigValue<T>& value) {
    for (const char* key : keys) {
        if (node[key]) {
            value.set(node[key].as<T>());
            return;
        }
    }
}

void ApplyBenchmark(const YAML::Node& b, ReplibenchConfig& config) {
    auto& bench = config.benchmark;
    SetIfPresent(b, {"duration_s", "T"}, bench.duration_s);
    SetIfPresent(b, {"throttle", "Throttle"}, bench.throttle);
    SetIfPresent(b, {"key_space", "K"}, bench.key_space);
    SetIfPresent(b, {"write_ratio", "W"}, bench.write_ratio);
    SetIfPresent(b, {"conflicts", "Conflicts"}, bench.conflicts);
    SetIfPresent(b, {"concurrency", "Concurrency"}, bench.concurrency);
    SetIfPresent(b, {"distribution", "Distribution"}, bench.distribution);
    SetIfPresent(b, {"zipfian_s", "ZipfianS"}, bench.zipfian_s);
    SetIfPresent(b, {"zipfian_theta", "ZipfianTheta"}, bench.zipfian_theta);
    SetIfPresent(b, {"dump_latency", "DumpLatency"}, bench.dump_latency);
    SetIfPresent(b, {"linearizability_check", "LinearizabilityCheck"}, bench.linearizability_check);
}

void ApplyRoot(const YAML::Node& root, ReplibenchConfig& config) {
    if (root["server"]) {
        auto server = root["server"];
        SetIfPresent(server, {"address"}, config.server.address);
        SetIfPresent(server, {"port"}, config.server.port);
        SetIfPresent(server, {"connect_timeout_ms"}, config.server.connect_timeout_ms);
    }

    if (root["benchmark"]) {
        ApplyBenchmark(root["benchmark"], config);
    }

    SetIfPresent(root, {"batch_size", "BatchSize"}, config.batch_size);
    SetIfPresent(root, {"buffer_size", "BufferSize"}, config.buffer_size);

    if (root["client"]) {
        auto client = root["client"];
        SetIfPresent(client, {"id"}, config.client.id);
        SetIfPresent(client, {"protocol"}, config.client.protocol);
        SetIfPresent(client, {"start_range"}, config.client.start_range);
        SetIfPresent(client, {"separate"}, config.client.separate);
    }

    if (root["results"]) {
        auto results = root["results"];
        SetIfPresent(results, {"record"}, config.results.record);
        SetIfPresent(results, {"dir"}, config.results.dir);
    }
}

bool ApplyDocument(const YAML::Node& yaml, ReplibenchConfig& config) {
    if (!yaml.IsMap()) {
        LOG(ERROR) << "Configuration root must be a map";
        return false;
    }
    // Either everything lives under "replibench:" or at the top level.
    ApplyRoot(yaml["replibench"] ? yaml["replibench"] : yaml, config);
    return true;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}

} // namespace

Protocol ParseProtocol(const std::string& value) {
    const std::string v = ToLower(value);
    if (v == "abd") {
        return Protocol::kAbd;
    }
    if (v == "epaxos" || v == "fastpath" || v == "fast_path") {
        return Protocol::kFastPath;
    }
    throw std::invalid_argument("Invalid protocol: " + value);
}

const char* ProtocolName(Protocol protocol) {
    return protocol == Protocol::kAbd ? "abd" : "fastpath";
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val = ToLower(env_val);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        return ApplyDocument(YAML::LoadFile(filename), config_);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        return ApplyDocument(YAML::Load(yaml_content), config_);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    if (result.count("id")) config_.client.id.set(result["id"].as<int>());
    if (result.count("sr")) config_.client.start_range.set(result["sr"].as<int>());
    if (result.count("sport")) config_.server.port.set(result["sport"].as<int>());
    if (result.count("saddr")) config_.server.address.set(result["saddr"].as<std::string>());
    if (result.count("sp")) config_.client.separate.set(result["sp"].as<bool>());
    if (result.count("algo")) config_.client.protocol.set(result["algo"].as<std::string>());
    if (result.count("record_results")) config_.results.record.set(true);
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const int conflicts = config_.benchmark.conflicts.get();
    if (conflicts < 0 || conflicts > 100) {
        validation_errors_.push_back("Conflicts percentage must be between 0 and 100");
    }

    const std::string distribution = config_.benchmark.distribution.get();
    if (distribution == "zipfan" || distribution == "zipfian") {
        const double theta = config_.benchmark.zipfian_theta.get();
        if (!(theta > 0.0 && theta < 1.0)) {
            validation_errors_.push_back("Zipfian theta must be between 0 and 1 (exclusive), got " +
                                         std::to_string(theta));
        }
    }

    if (config_.batch_size.get() < 1) {
        validation_errors_.push_back("Batch size must be at least 1");
    }

    if (config_.benchmark.concurrency.get() < 1) {
        validation_errors_.push_back("Concurrency must be at least 1");
    }

    if (config_.benchmark.duration_s.get() < 1) {
        validation_errors_.push_back("Benchmark duration must be at least 1 second");
    }

    if (config_.benchmark.key_space.get() < 1) {
        validation_errors_.push_back("Key space must contain at least one key");
    }

    if (config_.buffer_size.get() < 1) {
        validation_errors_.push_back("Response buffer size must be at least 1");
    }

    const int port = config_.server.port.get();
    if (port < 1 || port > 65535) {
        validation_errors_.push_back("Server port must be between 1 and 65535");
    }

    try {
        ParseProtocol(config_.client.protocol.get());
    } catch (const std::invalid_argument& e) {
        validation_errors_.push_back(e.what());
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

RunParameters Configuration::BuildRunParameters() const {
    RunParameters p;
    p.client_id = config_.client.id.get();
    p.protocol = ParseProtocol(config_.client.protocol.get());
    p.server_address = config_.server.address.get();
    p.server_port = config_.server.port.get();
    p.connect_timeout_ms = config_.server.connect_timeout_ms.get();

    p.duration_s = config_.benchmark.duration_s.get();
    p.request_count = static_cast<int64_t>(config_.benchmark.throttle.get());
    p.key_space = static_cast<int64_t>(config_.benchmark.key_space.get());
    p.write_ratio = config_.benchmark.write_ratio.get();
    p.conflicts = config_.benchmark.conflicts.get();
    p.concurrency = config_.benchmark.concurrency.get();
    p.batch_size = config_.batch_size.get();
    p.distribution = config_.benchmark.distribution.get();
    p.zipfian_s = config_.benchmark.zipfian_s.get();
    p.zipfian_theta = config_.benchmark.zipfian_theta.get();
    p.start_range = config_.client.start_range.get();
    p.separate = config_.client.separate.get();

    p.buffer_size = config_.buffer_size.get();
    p.dump_latency = config_.benchmark.dump_latency.get();
    p.linearizability_check = config_.benchmark.linearizability_check.get();
    p.record_results = config_.results.record.get();
    p.result_dir = config_.results.dir.get();
    return p;
}

} // namespace Replibench
