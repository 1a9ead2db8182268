#pragma once

#include "scenario_config.h"
#include <string>
#include <optional>

namespace OrbitView
{
    // Load a ScenarioConfig from a JSON file.
    // Returns std::nullopt on IO/parse failure, an unsupported schema_version, an empty
    // or duplicated body list (errors logged via Logger).
    std::optional<ScenarioConfig> load_scenario_config(const std::string &json_path);

    // Same as load_scenario_config, from an in-memory document. `source` names it in logs.
    std::optional<ScenarioConfig> parse_scenario_config(const std::string &json_text,
                                                        const std::string &source = "<memory>");

    // Serialize a ScenarioConfig to a JSON string (for saving/debugging).
    std::string serialize_scenario_config(const ScenarioConfig &config);

    // Save a ScenarioConfig to a JSON file.
    // Returns false on IO failure (errors logged via Logger).
    bool save_scenario_config(const std::string &json_path, const ScenarioConfig &config);
} // namespace OrbitView
