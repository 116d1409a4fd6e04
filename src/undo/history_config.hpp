#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace undostack {

/**
 * @brief Construction-time settings for a History instance.
 */
struct HistoryConfig {
    /// Emit misuse diagnostics. Never changes behavior.
    bool verbose = false;
    /// Maximum entries kept on the past stack, oldest dropped first. 0 means
    /// unbounded.
    std::size_t max_size = 0;
    /// Drop a push equal to the most recent single value.
    bool skip_duplicates = false;
};

nlohmann::json config_to_json(const HistoryConfig &config);

/**
 * @brief Read a config object. Missing keys keep their defaults.
 * @throws ConfigError if the value is not an object or a key has the wrong
 * type.
 */
HistoryConfig config_from_json(const nlohmann::json &j);

/**
 * @brief Load a config from a JSON file.
 * @throws IOError if the file cannot be opened.
 * @throws ConfigError if the content is not valid JSON or fails validation.
 */
HistoryConfig load_config(const std::string &filepath);

/**
 * @brief Write a config to a JSON file, pretty printed.
 * @throws IOError if the file cannot be written.
 */
void save_config(const std::string &filepath, const HistoryConfig &config);

} // namespace undostack
