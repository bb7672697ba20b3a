/**
 * @file config.cpp
 * @brief Configuration file parsing and management
 *
 * Handles YAML configuration loading with support for multiple profiles,
 * preset/mapping table overrides and parameter validation.
 */

#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <fstream>
#include <stdexcept>

namespace hdrtel {

// Helper function to safely get YAML value with default
template<typename T>
T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value)
{
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

bool EngineConfig::load_from_yaml(const std::string& yaml_path, const std::string& profile_name)
{
    try {
        YAML::Node config_file = YAML::LoadFile(yaml_path);

        if (!load_from_node(config_file)) {
            return false;
        }

        if (profile_name.empty()) {
            return true;
        }

        // Profile keys override the root
        if (!config_file["profiles"] || !config_file["profiles"][profile_name]) {
            std::cerr << "Profile not found in " << yaml_path << ": " << profile_name << std::endl;
            return false;
        }
        return load_from_node(config_file["profiles"][profile_name]);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "YAML parsing error: " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return false;
    }
}

bool EngineConfig::load_from_node(const YAML::Node& node)
{
    if (!node.IsMap()) {
        std::cerr << "Configuration must be a YAML map" << std::endl;
        return false;
    }

    // Loaded into a copy so a bad value leaves this config as it was
    EngineConfig loaded = *this;

    try {
        loaded.input_dir = get_yaml_value(node, "input_dir", input_dir);
        loaded.output_dir = get_yaml_value(node, "output_dir", output_dir);

        loaded.preset = get_yaml_value(node, "preset", preset);
        loaded.highlight_knee = get_yaml_value(node, "highlight_knee", highlight_knee);

        // Telemetry source
        loaded.telemetry_file = get_yaml_value(node, "telemetry_file", telemetry_file);
        loaded.simulate_telemetry = get_yaml_value(node, "simulate_telemetry", simulate_telemetry);
        loaded.simulation_seed = get_yaml_value(node, "simulation_seed", simulation_seed);
        loaded.frame_rate = get_yaml_value(node, "frame_rate", frame_rate);

        // Output options
        loaded.write_frame_csv = get_yaml_value(node, "write_frame_csv", write_frame_csv);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "Configuration value error: " << e.what() << std::endl;
        return false;
    }

    // Tables are validated once here, never at frame time
    if (node["presets"] && !loaded.presets.load_from_node(node["presets"])) {
        std::cerr << "Invalid presets section" << std::endl;
        return false;
    }

    if (node["telemetry_mappings"] && !loaded.mappings.load_from_node(node["telemetry_mappings"])) {
        std::cerr << "Invalid telemetry_mappings section" << std::endl;
        return false;
    }

    *this = loaded;
    return true;
}

bool EngineConfig::validate() const
{
    if (input_dir.empty() || output_dir.empty()) {
        std::cerr << "Input and output directories must be specified" << std::endl;
        return false;
    }

    if (preset.empty()) {
        std::cerr << "Preset must not be empty" << std::endl;
        return false;
    }

    if (!(highlight_knee > 0.0 && highlight_knee < 1.0)) {
        std::cerr << "Highlight knee must be in (0, 1)" << std::endl;
        return false;
    }

    if (!(frame_rate > 0.0)) {
        std::cerr << "Frame rate must be > 0" << std::endl;
        return false;
    }

    return true;
}

void EngineConfig::print() const
{
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Input: " << input_dir << std::endl;
    std::cout << "  Output: " << output_dir << std::endl;
    std::cout << "  Preset: " << preset
              << (presets.find(preset) ? "" : " (unknown, using defaults)") << std::endl;
    std::cout << "  Highlight knee: " << highlight_knee << std::endl;

    if (!telemetry_file.empty()) {
        std::cout << "  Telemetry: timeline " << telemetry_file << std::endl;
    }
    else if (simulate_telemetry) {
        std::cout << "  Telemetry: simulated (seed " << simulation_seed << ")" << std::endl;
    }
    else {
        std::cout << "  Telemetry: none" << std::endl;
    }

    std::cout << "  Frame rate: " << frame_rate << " fps" << std::endl;
    std::cout << "  Presets loaded: " << presets.presets().size() << std::endl;

    for (const auto& kv : mappings.tables()) {
        std::cout << "  Mapping " << telemetry_kind_name(kv.first) << ": "
                  << kv.second.breakpoints.size() << " breakpoints ("
                  << (kv.second.policy == MappingPolicy::Nearest ? "nearest" : "linear") << ")"
                  << std::endl;
    }
}

} // namespace hdrtel
