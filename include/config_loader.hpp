#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace reflow {

class ConfigLoader {
public:
    // Load overrides from ~/.reflow/config.json; a missing file leaves the config untouched
    static bool load_user_config(ReflowConfig& config, std::string& error);

    // Load overrides from a JSON file. Keys that are absent keep their current value.
    static bool load_from_file(const std::string& path, ReflowConfig& config, std::string& error);

    // Apply overrides from an already parsed document
    static bool load_from_json(const nlohmann::json& doc, ReflowConfig& config, std::string& error);

    // Full config as JSON (used by `reflow config` to print the defaults)
    static nlohmann::json to_json(const ReflowConfig& config);

    static std::string get_default_config_path();
};

} // namespace reflow
