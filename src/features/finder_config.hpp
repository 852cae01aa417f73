// src/features/finder_config.hpp
#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ========================== FinderConfig ==========================
struct FinderConfig {
    // Bounded dataset cache
    size_t      cache_limit        = 10'000;

    // Commit-log store (LogFaceStore)
    std::string log_directory      = "logs";
    size_t      log_rotation_size  = 16 * 1024 * 1024; // 16MB

    // Progress lines on stdout
    bool        verbose            = true;

    // Throws std::invalid_argument on unusable values.
    void validate() const;
};

inline void to_json(json& j, const FinderConfig& c) {
    j = json{
        {"cache_limit", c.cache_limit},
        {"log_directory", c.log_directory},
        {"log_rotation_size", c.log_rotation_size},
        {"verbose", c.verbose}
    };
}

// Missing keys keep their defaults.
void from_json(const json& j, FinderConfig& c);

// Reads a JSON config file. Throws std::runtime_error when the file cannot be
// opened; parse errors surface as nlohmann::json exceptions.
FinderConfig loadFinderConfig(const std::string& path);
