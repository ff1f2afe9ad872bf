#ifndef STRATA_CONFIGURATION_H_
#define STRATA_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Strata {

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

/**
 * Main configuration structure
 */
struct StrataConfig {
    // Ordered store backing marks and indexes
    struct Store {
        // Empty path keeps everything in memory
        ConfigValue<std::string> path{"", "STRATA_STORE_PATH"};
        ConfigValue<int> num_shards{64, "STRATA_STORE_NUM_SHARDS"};
        ConfigValue<bool> sync_on_write{false, "STRATA_STORE_SYNC_ON_WRITE"};
    } store;

    // Finalization of scopes
    struct Compactor {
        ConfigValue<int> worker_threads{4, "STRATA_COMPACTOR_WORKER_THREADS"};
        // Page size used when streaming index entries back to callers
        ConfigValue<int> scan_batch{256, "STRATA_COMPACTOR_SCAN_BATCH"};
    } compactor;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const StrataConfig& config() const { return config_; }
    StrataConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getStorePath() const { return config_.store.path.get(); }
    int getNumShards() const { return config_.store.num_shards.get(); }
    int getWorkerThreads() const { return config_.compactor.worker_threads.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restore every value to its compiled-in default
    void reset() { config_ = StrataConfig{}; }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    StrataConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseRoot(const YAML::Node& root);
};

const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Strata

#endif // STRATA_CONFIGURATION_H_
