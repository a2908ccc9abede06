#ifndef REPLIBENCH_CONFIGURATION_H_
#define REPLIBENCH_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace cxxopts {
class ParseResult;
}

namespace Replibench {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

enum class Protocol {
    kAbd,
    kFastPath,
};

/// Parses "abd" or "epaxos"/"fastpath" (case-insensitive). Throws std::invalid_argument.
Protocol ParseProtocol(const std::string& value);
const char* ProtocolName(Protocol protocol);

/**
 * Everything a benchmark run needs, resolved once before issuance starts.
 * Components take it by const reference and never modify it.
 */
struct RunParameters {
    int client_id = 0;
    Protocol protocol = Protocol::kAbd;

    std::string server_address = "127.0.0.1";
    int server_port = 7074;
    int connect_timeout_ms = 2000;

    int duration_s = 10;          // T
    int64_t request_count = 1000; // throttle
    int64_t key_space = 1000;     // K
    double write_ratio = 0.5;     // W
    int conflicts = 0;            // percent, [0, 100]
    int concurrency = 1;
    int batch_size = 1;
    std::string distribution = "uniform";
    double zipfian_s = 2.0;
    double zipfian_theta = 0.99;
    int64_t start_range = 0;
    bool separate = false;

    size_t buffer_size = 1024;    // decoded response queue capacity
    bool dump_latency = false;
    bool linearizability_check = false;
    bool record_results = false;
    std::string result_dir = "./results";

    double read_ratio() const { return 1.0 - write_ratio; }
};

/**
 * Client configuration with per-field environment overrides.
 */
struct ReplibenchConfig {
    struct Server {
        ConfigValue<std::string> address{"127.0.0.1", "REPLIBENCH_SERVER_ADDRESS"};
        ConfigValue<int> port{7074, "REPLIBENCH_SERVER_PORT"};
        ConfigValue<int> connect_timeout_ms{2000, "REPLIBENCH_CONNECT_TIMEOUT_MS"};
    } server;

    struct Benchmark {
        ConfigValue<int> duration_s{10, "REPLIBENCH_DURATION_S"};
        ConfigValue<size_t> throttle{1000, "REPLIBENCH_THROTTLE"};
        ConfigValue<size_t> key_space{1000, "REPLIBENCH_KEY_SPACE"};
        ConfigValue<double> write_ratio{0.5, "REPLIBENCH_WRITE_RATIO"};
        ConfigValue<int> conflicts{0, "REPLIBENCH_CONFLICTS"};
        ConfigValue<int> concurrency{1, "REPLIBENCH_CONCURRENCY"};
        ConfigValue<std::string> distribution{"uniform", "REPLIBENCH_DISTRIBUTION"};
        ConfigValue<double> zipfian_s{2.0, "REPLIBENCH_ZIPFIAN_S"};
        ConfigValue<double> zipfian_theta{0.99, "REPLIBENCH_ZIPFIAN_THETA"};
        ConfigValue<bool> dump_latency{false, "REPLIBENCH_DUMP_LATENCY"};
        ConfigValue<bool> linearizability_check{false, "REPLIBENCH_LINEARIZABILITY_CHECK"};
    } benchmark;

    ConfigValue<int> batch_size{1, "REPLIBENCH_BATCH_SIZE"};
    ConfigValue<size_t> buffer_size{1024, "REPLIBENCH_BUFFER_SIZE"};

    struct Client {
        ConfigValue<int> id{0, "REPLIBENCH_CLIENT_ID"};
        ConfigValue<std::string> protocol{"abd", "REPLIBENCH_PROTOCOL"};
        ConfigValue<int> start_range{0, "REPLIBENCH_START_RANGE"};
        ConfigValue<bool> separate{false, "REPLIBENCH_SEPARATE"};
    } client;

    struct Results {
        ConfigValue<bool> record{false, "REPLIBENCH_RECORD_RESULTS"};
        ConfigValue<std::string> dir{"./results", "REPLIBENCH_RESULT_DIR"};
    } results;
};

/**
 * Loads the client configuration (YAML file, environment, command line) and
 * resolves it into RunParameters.
 */
class Configuration {
public:
    Configuration() = default;

    // Load configuration from file. JSON files are accepted as well.
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(const cxxopts::ParseResult& result);

    const ReplibenchConfig& config() const { return config_; }
    ReplibenchConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    /// Resolves the final values. Call validate() first; throws
    /// std::invalid_argument on values that cannot be converted.
    RunParameters BuildRunParameters() const;

private:
    ReplibenchConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Replibench

#endif // REPLIBENCH_CONFIGURATION_H_
