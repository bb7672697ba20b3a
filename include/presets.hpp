#pragma once

#include <map>
#include <string>
#include <yaml-cpp/yaml.h>
#include "parameters.hpp"

namespace hdrtel {

/**
 * @brief Named baseline definitions
 *
 * Loaded once at startup and never mutated afterwards. The set is open:
 * YAML may add presets beside or replace the shipped ones.
 */
class PresetTable {
public:
    /**
     * Shipped presets: performance, balanced, quality
     */
    static PresetTable builtin();

    /**
     * @brief Add or replace presets from a YAML map of id -> definition
     *
     * Required keys: clahe_clip, clahe_grid [cols, rows], saturation,
     * sharpening, tone_curve, denoise; denoise_strength when denoise is true.
     *
     * @return false on missing or unknown keys and out-of-range values
     */
    bool load_from_node(const YAML::Node& node);

    void add(const PresetDefinition& preset);

    // nullptr when the id is unknown
    const PresetDefinition* find(const std::string& id) const;

    const std::map<std::string, PresetDefinition>& presets() const { return presets_; }

private:
    std::map<std::string, PresetDefinition> presets_;
};

} // namespace hdrtel
