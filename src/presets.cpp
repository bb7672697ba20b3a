/**
 * @file presets.cpp
 * @brief Shipped presets and strict YAML preset loading
 */

#include "presets.hpp"
#include <iostream>
#include <set>

namespace hdrtel {

namespace {

PresetDefinition make_preset(const std::string& name, double clip, int grid,
                             double saturation, double sharpen, ToneCurve curve,
                             bool denoise, int denoise_strength)
{
    PresetDefinition p;
    p.name = name;
    p.clahe_clip_limit = clip;
    p.clahe_grid.cols = grid;
    p.clahe_grid.rows = grid;
    p.saturation = saturation;
    p.sharpen_strength = sharpen;
    p.tone_curve = curve;
    p.denoise_enabled = denoise;
    p.denoise_strength = denoise ? denoise_strength : 0;
    return p;
}

bool parse_preset(const std::string& name, const YAML::Node& node, PresetDefinition& preset)
{
    static const std::set<std::string> kKnownKeys = {
        "clahe_clip", "clahe_grid", "saturation", "sharpening",
        "tone_curve", "denoise", "denoise_strength"
    };

    if (!node.IsMap()) {
        std::cerr << "Preset '" << name << "' must be a map" << std::endl;
        return false;
    }

    for (const auto& kv : node) {
        const std::string key = kv.first.as<std::string>();
        if (kKnownKeys.count(key) == 0) {
            std::cerr << "Preset '" << name << "' has unknown key: " << key << std::endl;
            return false;
        }
    }

    for (const char* required : {"clahe_clip", "clahe_grid", "saturation", "sharpening", "tone_curve", "denoise"}) {
        if (!node[required]) {
            std::cerr << "Preset '" << name << "' is missing " << required << std::endl;
            return false;
        }
    }

    preset.name = name;
    preset.clahe_clip_limit = node["clahe_clip"].as<double>();
    preset.saturation = node["saturation"].as<double>();
    preset.sharpen_strength = node["sharpening"].as<double>();
    preset.denoise_enabled = node["denoise"].as<bool>();

    const YAML::Node grid = node["clahe_grid"];
    if (!grid.IsSequence() || grid.size() != 2) {
        std::cerr << "Preset '" << name << "' clahe_grid must be [cols, rows]" << std::endl;
        return false;
    }
    preset.clahe_grid.cols = grid[0].as<int>();
    preset.clahe_grid.rows = grid[1].as<int>();

    const std::string curve = node["tone_curve"].as<std::string>();
    if (!parse_tone_curve(curve, preset.tone_curve)) {
        std::cerr << "Preset '" << name << "' has unknown tone_curve: " << curve << std::endl;
        return false;
    }

    if (preset.denoise_enabled) {
        if (!node["denoise_strength"]) {
            std::cerr << "Preset '" << name << "' enables denoise without denoise_strength" << std::endl;
            return false;
        }
        preset.denoise_strength = node["denoise_strength"].as<int>();
    }
    else {
        preset.denoise_strength = 0;
    }

    // Range checks
    if (preset.clahe_grid.cols <= 0 || preset.clahe_grid.rows <= 0) {
        std::cerr << "Preset '" << name << "' clahe_grid must be positive" << std::endl;
        return false;
    }
    if (preset.clahe_clip_limit < 0.0) {
        std::cerr << "Preset '" << name << "' clahe_clip must be >= 0" << std::endl;
        return false;
    }
    if (preset.saturation < 0.0 || preset.saturation > EnhancementParameters::kMaxGain) {
        std::cerr << "Preset '" << name << "' saturation must be in [0, 3]" << std::endl;
        return false;
    }
    if (preset.sharpen_strength < 0.0 || preset.sharpen_strength > 1.0) {
        std::cerr << "Preset '" << name << "' sharpening must be in [0, 1]" << std::endl;
        return false;
    }
    if (preset.denoise_strength < 0) {
        std::cerr << "Preset '" << name << "' denoise_strength must be >= 0" << std::endl;
        return false;
    }

    return true;
}

} // anonymous namespace

PresetTable PresetTable::builtin()
{
    PresetTable table;
    table.add(make_preset("performance", 2.0, 4, 1.05, 0.3, ToneCurve::Linear, false, 0));
    table.add(make_preset("balanced", 3.0, 8, 1.10, 0.6, ToneCurve::SCurve, true, 5));
    table.add(make_preset("quality", 4.0, 16, 1.15, 0.8, ToneCurve::Adaptive, true, 10));
    return table;
}

bool PresetTable::load_from_node(const YAML::Node& node)
{
    try {
        if (!node.IsMap()) {
            std::cerr << "presets must be a map of id -> definition" << std::endl;
            return false;
        }

        // Parse everything before touching the table so a bad entry changes nothing
        std::map<std::string, PresetDefinition> loaded;
        for (const auto& kv : node) {
            const std::string id = kv.first.as<std::string>();
            PresetDefinition preset;
            if (!parse_preset(id, kv.second, preset)) {
                return false;
            }
            loaded[id] = preset;
        }

        for (const auto& kv : loaded) {
            presets_[kv.first] = kv.second;
        }
        return true;
    }
    catch (const YAML::Exception& e) {
        std::cerr << "Preset table error: " << e.what() << std::endl;
        return false;
    }
}

void PresetTable::add(const PresetDefinition& preset)
{
    presets_[preset.name] = preset;
}

const PresetDefinition* PresetTable::find(const std::string& id) const
{
    auto it = presets_.find(id);
    if (it == presets_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace hdrtel
