#include "history_config.hpp"

#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

using json = nlohmann::json;

namespace undostack {

namespace {

constexpr const char *VERBOSE_KEY = "verbose";
constexpr const char *MAX_SIZE_KEY = "max_size";
constexpr const char *SKIP_DUPLICATES_KEY = "skip_duplicates";

bool read_bool(const json &j, const char *key, bool fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto &value = j.at(key);
    if (!value.is_boolean()) {
        throw ConfigError(fmt::format("'{}' must be a boolean", key));
    }
    return value.get<bool>();
}

} // namespace

json config_to_json(const HistoryConfig &config) {
    json j;
    j[VERBOSE_KEY] = config.verbose;
    j[MAX_SIZE_KEY] = config.max_size;
    j[SKIP_DUPLICATES_KEY] = config.skip_duplicates;
    return j;
}

HistoryConfig config_from_json(const json &j) {
    if (!j.is_object()) {
        throw ConfigError("history config must be a JSON object");
    }

    HistoryConfig config;
    config.verbose = read_bool(j, VERBOSE_KEY, config.verbose);
    config.skip_duplicates =
        read_bool(j, SKIP_DUPLICATES_KEY, config.skip_duplicates);

    if (j.contains(MAX_SIZE_KEY)) {
        const auto &value = j.at(MAX_SIZE_KEY);
        if (!value.is_number_integer() || value.get<long long>() < 0) {
            throw ConfigError(fmt::format(
                "'{}' must be a non-negative integer", MAX_SIZE_KEY));
        }
        config.max_size = value.get<std::size_t>();
    }
    return config;
}

HistoryConfig load_config(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError(fmt::format("cannot open '{}'", filepath));
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error &e) {
        throw ConfigError(fmt::format("'{}' is not valid JSON: {}", filepath,
                                      e.what()));
    }

    HistoryConfig config = config_from_json(j);
    LOG_DEBUG(fmt::format("Loaded history config from {}", filepath));
    return config;
}

void save_config(const std::string &filepath, const HistoryConfig &config) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IOError(fmt::format("cannot write '{}'", filepath));
    }

    file << config_to_json(config).dump(2); // Pretty print with 2 spaces
    if (!file) {
        throw IOError(fmt::format("failed writing '{}'", filepath));
    }
}

} // namespace undostack
