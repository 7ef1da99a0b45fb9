#include "configuration.h"
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Sonar {

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
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["sonar"]) {
        return;
    }
    auto root = yaml["sonar"];

    // Monitor
    if (root["monitor"]) {
        auto monitor = root["monitor"];
        if (monitor["total_cycle_ms"]) config_.monitor.total_cycle_ms.set(monitor["total_cycle_ms"].as<int>());
    }

    // Coordinator
    if (root["coordinator"]) {
        auto coordinator = root["coordinator"];
        if (coordinator["listen_address"]) config_.coordinator.listen_address.set(coordinator["listen_address"].as<std::string>());
        if (coordinator["probe_deadline_ms"]) config_.coordinator.probe_deadline_ms.set(coordinator["probe_deadline_ms"].as<int>());
    }

    // Peer
    if (root["peer"]) {
        auto peer = root["peer"];
        if (peer["coordinator_address"]) config_.peer.coordinator_address.set(peer["coordinator_address"].as<std::string>());
        if (peer["clock_port"]) config_.peer.clock_port.set(peer["clock_port"].as<int>());
        if (peer["advertise_host"]) config_.peer.advertise_host.set(peer["advertise_host"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"total-cycle-ms", required_argument, 0, 'y'},
        {"listen", required_argument, 0, 'a'},
        {"probe-deadline-ms", required_argument, 0, 'd'},
        {"coordinator", required_argument, 0, 'r'},
        {"clock-port", required_argument, 0, 'k'},
        {"advertise-host", required_argument, 0, 'H'},
        {"config", required_argument, 0, 'f'},
        // Accept flags owned by the binaries so getopt_long doesn't error
        {"peer-id", required_argument, 0, 0},
        {"log_level", required_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "y:a:d:r:k:H:f:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'y':
                    config_.monitor.total_cycle_ms.set(std::stoi(optarg));
                    break;
                case 'a':
                    config_.coordinator.listen_address.set(optarg);
                    break;
                case 'd':
                    config_.coordinator.probe_deadline_ms.set(std::stoi(optarg));
                    break;
                case 'r':
                    config_.peer.coordinator_address.set(optarg);
                    break;
                case 'k':
                    config_.peer.clock_port.set(std::stoi(optarg));
                    break;
                case 'H':
                    config_.peer.advertise_host.set(optarg);
                    break;
                case 'f':
                    if (!loadFromFile(optarg)) {
                        LOG(WARNING) << "Ignoring configuration file " << optarg;
                    }
                    break;
                case 0:
                    // Known app flags we intentionally ignore here (handled elsewhere)
                    break;
                default:
                    // Ignore unknown flags to avoid noisy logs; app parser handles them
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Invalid value for option " << static_cast<char>(c) << ": " << optarg;
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.monitor.total_cycle_ms.get() < 1) {
        validation_errors_.push_back("Total cycle must be at least 1 millisecond");
    }

    if (config_.coordinator.probe_deadline_ms.get() < 0) {
        validation_errors_.push_back("Probe deadline cannot be negative");
    }

    if (config_.coordinator.listen_address.get().empty()) {
        validation_errors_.push_back("Coordinator listen address cannot be empty");
    }

    if (config_.peer.coordinator_address.get().empty()) {
        validation_errors_.push_back("Peer coordinator address cannot be empty");
    }

    if (config_.peer.clock_port.get() < 1024 || config_.peer.clock_port.get() > 65535) {
        validation_errors_.push_back("Peer clock port must be between 1024 and 65535");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Sonar
