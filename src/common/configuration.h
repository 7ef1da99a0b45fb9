#ifndef SONAR_SRC_COMMON_CONFIGURATION_H_
#define SONAR_SRC_COMMON_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace Sonar {

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

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct SonarConfig {
    // Probe scheduling
    struct Monitor {
        // Time allotted to probing every registered peer once.
        // Per-peer spacing is total_cycle_ms / number of peers.
        ConfigValue<int> total_cycle_ms{static_cast<int>(kDefaultTotalCycleMs), "SONAR_TOTAL_CYCLE_MS"};
    } monitor;

    // Coordinator process
    struct Coordinator {
        ConfigValue<std::string> listen_address{"0.0.0.0:" + std::to_string(kDefaultCoordinatorPort),
            "SONAR_COORDINATOR_LISTEN"};
        // 0 leaves ReadClock without a deadline
        ConfigValue<int> probe_deadline_ms{0, "SONAR_PROBE_DEADLINE_MS"};
    } coordinator;

    // Peer agent process
    struct Peer {
        ConfigValue<std::string> coordinator_address{"127.0.0.1:" + std::to_string(kDefaultCoordinatorPort),
            "SONAR_PEER_COORDINATOR"};
        ConfigValue<int> clock_port{kDefaultPeerClockPort, "SONAR_PEER_CLOCK_PORT"};
        // Host the coordinator uses to reach this peer's clock service
        ConfigValue<std::string> advertise_host{"127.0.0.1", "SONAR_PEER_ADVERTISE_HOST"};
    } peer;
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

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const SonarConfig& config() const { return config_; }
    SonarConfig& config() { return config_; }

    // Back to compiled-in defaults
    void reset() { config_ = SonarConfig{}; }

    // Helper methods for common access patterns
    int getTotalCycleMs() const { return config_.monitor.total_cycle_ms.get(); }
    std::string getListenAddress() const { return config_.coordinator.listen_address.get(); }
    int getProbeDeadlineMs() const { return config_.coordinator.probe_deadline_ms.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SonarConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Shorthand for Configuration::getInstance()
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Sonar

#endif // SONAR_SRC_COMMON_CONFIGURATION_H_
