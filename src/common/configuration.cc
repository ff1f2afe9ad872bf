#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Strata {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
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
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseRoot(const YAML::Node& yaml) {
    if (!yaml["strata"]) {
        LOG(WARNING) << "Configuration has no top-level 'strata' section; keeping defaults";
        return;
    }
    auto root = yaml["strata"];

    // Store
    if (root["store"]) {
        auto store = root["store"];
        if (store["path"]) config_.store.path.set(store["path"].as<std::string>());
        if (store["num_shards"]) config_.store.num_shards.set(store["num_shards"].as<int>());
        if (store["sync_on_write"]) config_.store.sync_on_write.set(store["sync_on_write"].as<bool>());
    }

    // Compactor
    if (root["compactor"]) {
        auto compactor = root["compactor"];
        if (compactor["worker_threads"]) config_.compactor.worker_threads.set(compactor["worker_threads"].as<int>());
        if (compactor["scan_batch"]) config_.compactor.scan_batch.set(compactor["scan_batch"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseRoot(yaml);
        if (!validate()) {
            for (const auto& error : validation_errors_) {
                LOG(ERROR) << "Invalid configuration in " << filename << ": " << error;
            }
            return false;
        }
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseRoot(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Shard count is a modulus for key hashing
    if (config_.store.num_shards.get() < 1 || config_.store.num_shards.get() > 4096) {
        validation_errors_.push_back("Store shard count must be between 1 and 4096");
    }

    if (config_.compactor.worker_threads.get() < 1) {
        validation_errors_.push_back("Compactor worker threads must be at least 1");
    }

    if (config_.compactor.scan_batch.get() < 1) {
        validation_errors_.push_back("Compactor scan batch must be at least 1");
    }

    if (config_.store.sync_on_write.get() && config_.store.path.get().empty()) {
        validation_errors_.push_back("sync_on_write requires a store path");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Strata
