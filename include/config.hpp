#pragma once

#include <string>
#include <cstdint>
#include <yaml-cpp/yaml.h>
#include "mapping.hpp"
#include "presets.hpp"

namespace hdrtel {

/**
 * @brief Enhancement tool configuration
 *
 * Contains I/O paths, the preset selection, lookup-table constants,
 * the telemetry source and the preset/mapping tables themselves.
 */
struct EngineConfig {
    // Frame directories
    std::string input_dir;
    std::string output_dir;

    // Processing
    std::string preset = "balanced";
    double highlight_knee = 0.7;     // Knee for the highlight compression table

    // Telemetry source (timeline file wins over simulation)
    std::string telemetry_file;
    bool simulate_telemetry = false;
    uint32_t simulation_seed = 42;
    double frame_rate = 30.0;        // Stream time base for simulation/timestamps

    // Output options
    bool write_frame_csv = false;    // Write per-frame metrics CSV

    // Static tables, built-ins unless overridden
    PresetTable presets = PresetTable::builtin();
    TelemetryMappings mappings = TelemetryMappings::builtin();

    /**
     * @brief Read engine settings from a YAML file
     * @param yaml_path Config file on disk
     * @param profile_name Entry under `profiles:` layered over the root keys, or empty
     * @return false if the file, the profile or any table is malformed
     */
    bool load_from_yaml(const std::string& yaml_path, const std::string& profile_name = "");

    // Same as load_from_yaml for an already parsed document; keys not present keep their values
    bool load_from_node(const YAML::Node& node);

    // Paths set, knee in (0, 1), positive frame rate, non-empty preset id
    bool validate() const;

    void print() const;
};

} // namespace hdrtel
