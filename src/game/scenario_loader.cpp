#include "scenario_loader.h"
#include "core/util/color.h"
#include "core/util/logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace OrbitView
{
    using json = nlohmann::json;

    // ---- Helper: read optional fields with defaults ----

    namespace
    {
        template<typename T>
        T json_get(const json &j, const char *key, const T &fallback)
        {
            if (j.contains(key) && !j[key].is_null())
            {
                return j[key].get<T>();
            }
            return fallback;
        }

        PhysicsVec2 json_get_dvec2(const json &j, const char *key, const PhysicsVec2 &fallback = PhysicsVec2(0.0))
        {
            if (!j.contains(key) || j[key].is_null())
            {
                return fallback;
            }
            const auto &v = j[key];
            return PhysicsVec2(
                    json_get<double>(v, "x", fallback.x),
                    json_get<double>(v, "y", fallback.y));
        }

        // Integer field in [1, max]; falls back (with a warning) when out of range.
        template<typename T>
        T json_get_positive(const json &j, const char *key, const T &fallback,
                            const T &max = std::numeric_limits<T>::max())
        {
            const int64_t v = json_get<int64_t>(j, key, static_cast<int64_t>(fallback));
            if (v <= 0 || static_cast<uint64_t>(v) > static_cast<uint64_t>(max))
            {
                Logger::warn("'{}' must be in [1, {}] (got {}), using {}.", key, max, v, fallback);
                return fallback;
            }
            return static_cast<T>(v);
        }

        std::string checked_color(const std::string &value, const std::string &fallback, const std::string &owner)
        {
            if (parse_hex_color(value))
            {
                return value;
            }
            Logger::warn("Body '{}': invalid color '{}', using {}.", owner, value, fallback);
            return fallback;
        }

        // ---- Loop ----

        LoopConfig parse_loop_config(const json &j)
        {
            const LoopConfig defaults{};
            LoopConfig c{};
            c.scale_factor = json_get<double>(j, "scale_factor", defaults.scale_factor);
            c.physics_interval_s = json_get<double>(j, "physics_interval_s", defaults.physics_interval_s);
            c.trail_every_n_frames = json_get_positive<uint32_t>(j, "trail_every_n_frames", defaults.trail_every_n_frames);
            c.trail_capacity = json_get_positive<size_t>(j, "trail_capacity", defaults.trail_capacity, kMaxTrailCapacity);
            c.tracked_body = json_get<std::string>(j, "tracked_body", defaults.tracked_body);
            c.light_body = json_get<std::string>(j, "light_body", defaults.light_body);
            return c;
        }

        json serialize_loop_config(const LoopConfig &c)
        {
            json j;
            j["scale_factor"] = c.scale_factor;
            j["physics_interval_s"] = c.physics_interval_s;
            j["trail_every_n_frames"] = c.trail_every_n_frames;
            j["trail_capacity"] = c.trail_capacity;
            j["tracked_body"] = c.tracked_body;
            j["light_body"] = c.light_body;
            return j;
        }

        // ---- BodyDef ----

        ScenarioConfig::BodyDef parse_body_def(const json &j)
        {
            ScenarioConfig::BodyDef d{};
            Body &b = d.body;
            b.id = json_get<std::string>(j, "id", "unnamed");
            b.name = json_get<std::string>(j, "name", b.id);
            b.mass_kg = json_get<double>(j, "mass_kg", 0.0);
            b.position_m = json_get_dvec2(j, "position_m");
            b.velocity_mps = json_get_dvec2(j, "velocity_mps");
            b.radius_m = json_get<double>(j, "radius_m", 0.0);
            b.color = checked_color(json_get<std::string>(j, "color", "#FFFFFF"), "#FFFFFF", b.id);

            d.rotation_speed = json_get<float>(j, "rotation_speed", 0.0f);
            d.trail = json_get<bool>(j, "trail", true);
            d.trail_color = checked_color(json_get<std::string>(j, "trail_color", b.color), b.color, b.id);
            d.trail_opacity = json_get<float>(j, "trail_opacity", 0.6f);
            d.is_star = json_get<bool>(j, "is_star", false);
            return d;
        }

        json serialize_body_def(const ScenarioConfig::BodyDef &d)
        {
            const Body &b = d.body;
            json j;
            j["id"] = b.id;
            j["name"] = b.name;
            j["mass_kg"] = b.mass_kg;
            j["position_m"] = {{"x", b.position_m.x}, {"y", b.position_m.y}};
            j["velocity_mps"] = {{"x", b.velocity_mps.x}, {"y", b.velocity_mps.y}};
            j["radius_m"] = b.radius_m;
            j["color"] = b.color;
            j["rotation_speed"] = d.rotation_speed;
            j["trail"] = d.trail;
            j["trail_color"] = d.trail_color;
            j["trail_opacity"] = d.trail_opacity;
            j["is_star"] = d.is_star;
            return j;
        }

        std::optional<ScenarioConfig> parse_root(const json &root, const std::string &source)
        {
            ScenarioConfig cfg;
            cfg.schema_version = json_get<int>(root, "schema_version", kScenarioSchemaVersion);
            if (cfg.schema_version != kScenarioSchemaVersion)
            {
                Logger::error("Scenario '{}': unsupported schema_version {} (expected {}).",
                              source, cfg.schema_version, kScenarioSchemaVersion);
                return std::nullopt;
            }

            if (root.contains("loop") && root["loop"].is_object())
            {
                cfg.loop = parse_loop_config(root["loop"]);
            }

            if (root.contains("physics") && root["physics"].is_object())
            {
                cfg.physics_dt_s = json_get<double>(root["physics"], "dt_s", kDefaultPhysicsDtSeconds);
            }

            if (root.contains("display") && root["display"].is_object())
            {
                const auto &d = root["display"];
                cfg.display_reference_body = json_get<std::string>(d, "reference_body", cfg.display_reference_body);
                cfg.display_reference_scale = json_get<float>(d, "reference_scale", cfg.display_reference_scale);
                cfg.display_star_compression = json_get<double>(d, "star_compression", cfg.display_star_compression);
            }

            if (root.contains("bodies") && root["bodies"].is_array())
            {
                for (const auto &elem : root["bodies"])
                {
                    cfg.bodies.push_back(parse_body_def(elem));
                }
            }

            if (cfg.bodies.empty())
            {
                Logger::error("Scenario '{}' has no bodies defined.", source);
                return std::nullopt;
            }

            std::unordered_set<std::string> ids;
            for (const auto &b : cfg.bodies)
            {
                if (!ids.insert(b.body.id).second)
                {
                    Logger::error("Scenario '{}': duplicate body id '{}'.", source, b.body.id);
                    return std::nullopt;
                }
            }

            if (!cfg.loop.tracked_body.empty() && !cfg.find_body(cfg.loop.tracked_body))
            {
                Logger::warn("Scenario '{}': tracked body '{}' is not defined.", source, cfg.loop.tracked_body);
            }

            Logger::info("Loaded scenario '{}': {} bodies", source, cfg.bodies.size());
            return cfg;
        }
    } // anonymous namespace

    // ========================================================================
    // Public API
    // ========================================================================

    std::optional<ScenarioConfig> load_scenario_config(const std::string &json_path)
    {
        std::ifstream file(json_path);
        if (!file.is_open())
        {
            Logger::error("Failed to open scenario file: {}", json_path);
            return std::nullopt;
        }

        std::stringstream ss;
        ss << file.rdbuf();
        return parse_scenario_config(ss.str(), json_path);
    }

    std::optional<ScenarioConfig> parse_scenario_config(const std::string &json_text, const std::string &source)
    {
        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const json::parse_error &e)
        {
            Logger::error("JSON parse error in '{}': {}", source, e.what());
            return std::nullopt;
        }

        if (!root.is_object())
        {
            Logger::error("Scenario '{}': top-level value must be an object.", source);
            return std::nullopt;
        }

        try
        {
            return parse_root(root, source);
        }
        catch (const json::exception &e)
        {
            Logger::error("Scenario '{}': {}", source, e.what());
            return std::nullopt;
        }
    }

    std::string serialize_scenario_config(const ScenarioConfig &config)
    {
        json root;
        root["schema_version"] = kScenarioSchemaVersion;
        root["loop"] = serialize_loop_config(config.loop);
        root["physics"] = {{"dt_s", config.physics_dt_s}};
        root["display"] = {
                {"reference_body", config.display_reference_body},
                {"reference_scale", config.display_reference_scale},
                {"star_compression", config.display_star_compression}};

        root["bodies"] = json::array();
        for (const auto &b : config.bodies)
        {
            root["bodies"].push_back(serialize_body_def(b));
        }

        return root.dump(2);
    }

    bool save_scenario_config(const std::string &json_path, const ScenarioConfig &config)
    {
        std::ofstream file(json_path, std::ios::out | std::ios::trunc);
        if (!file.is_open())
        {
            Logger::error("Failed to open scenario file for writing: {}", json_path);
            return false;
        }

        file << serialize_scenario_config(config) << '\n';
        if (!file.good())
        {
            Logger::error("Failed to write scenario file: {}", json_path);
            return false;
        }

        Logger::info("Saved scenario '{}' ({} bodies)", json_path, config.bodies.size());
        return true;
    }
} // namespace OrbitView
