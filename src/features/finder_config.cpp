#include <fstream>
#include <stdexcept>
#include <string>

#include "finder_config.hpp"

void FinderConfig::validate() const {
    if (cache_limit == 0) {
        throw std::invalid_argument("cache_limit must be positive");
    }
    if (log_directory.empty()) {
        throw std::invalid_argument("log_directory must not be empty");
    }
    if (log_rotation_size == 0) {
        throw std::invalid_argument("log_rotation_size must be positive");
    }
}

void from_json(const json& j, FinderConfig& c) {
    FinderConfig defaults;
    c.cache_limit = j.value("cache_limit", defaults.cache_limit);
    c.log_directory = j.value("log_directory", defaults.log_directory);
    c.log_rotation_size = j.value("log_rotation_size", defaults.log_rotation_size);
    c.verbose = j.value("verbose", defaults.verbose);
}

FinderConfig loadFinderConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j = json::parse(file);
    FinderConfig config = j.get<FinderConfig>();
    config.validate();
    return config;
}
