/**
 * @file mapping.cpp
 * @brief Telemetry-to-parameter mapping tables
 *
 * Holds the built-in breakpoint tables and their YAML loader. Tables are
 * validated once here so the interpolator never sees malformed input.
 */

#include "mapping.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <utility>

namespace hdrtel {

namespace {

struct FieldName {
    EffectField field;
    const char* name;
};

const FieldName kFieldNames[] = {
    {EffectField::Exposure, "exposure"},
    {EffectField::Contrast, "contrast"},
    {EffectField::Saturation, "saturation"},
    {EffectField::Sharpening, "sharpening"},
    {EffectField::Highlights, "highlights"},
    {EffectField::Shadows, "shadows"},
    {EffectField::RedGain, "r_gain"},
    {EffectField::BlueGain, "b_gain"},
    {EffectField::ClaheClip, "clahe_clip"},
    {EffectField::DenoiseStrength, "denoise_strength"},
};

Breakpoint make_breakpoint(double at, std::initializer_list<std::pair<EffectField, double>> fields)
{
    Breakpoint bp;
    bp.at = at;
    for (const auto& f : fields) {
        bp.effect.set(f.first, f.second);
    }
    return bp;
}

MappingPolicy default_policy(TelemetryKind kind)
{
    // Motion-driven sharpening snaps instead of gliding
    return kind == TelemetryKind::Motion ? MappingPolicy::Nearest : MappingPolicy::Linear;
}

bool parse_breakpoints(const YAML::Node& list, const std::string& kind_name,
                       std::vector<Breakpoint>& out)
{
    if (!list.IsSequence() || list.size() == 0) {
        std::cerr << "Mapping '" << kind_name << "' needs a non-empty breakpoint list" << std::endl;
        return false;
    }

    for (const auto& entry : list) {
        if (!entry.IsMap() || !entry["at"]) {
            std::cerr << "Mapping '" << kind_name << "' breakpoint must be a map with 'at'" << std::endl;
            return false;
        }

        Breakpoint bp;
        bp.at = entry["at"].as<double>();
        if (!std::isfinite(bp.at)) {
            std::cerr << "Mapping '" << kind_name << "' has a non-finite breakpoint" << std::endl;
            return false;
        }

        for (const auto& kv : entry) {
            const std::string key = kv.first.as<std::string>();
            if (key == "at") {
                continue;
            }
            EffectField field;
            if (!parse_effect_field(key, field)) {
                std::cerr << "Mapping '" << kind_name << "' has unknown field: " << key << std::endl;
                return false;
            }
            bp.effect.set(field, kv.second.as<double>());
        }
        out.push_back(bp);
    }
    return true;
}

} // anonymous namespace

const char* effect_field_name(EffectField field)
{
    for (const auto& f : kFieldNames) {
        if (f.field == field) {
            return f.name;
        }
    }
    return "unknown";
}

bool parse_effect_field(const std::string& name, EffectField& field)
{
    for (const auto& f : kFieldNames) {
        if (name == f.name) {
            field = f.field;
            return true;
        }
    }
    return false;
}

// ============================================================================
// ParameterEffect
// ============================================================================

double ParameterEffect::get(EffectField field) const
{
    auto it = fields.find(field);
    return it == fields.end() ? 0.0 : it->second;
}

void ParameterEffect::apply_to(EnhancementParameters& params) const
{
    bool touches_white_balance = false;

    for (const auto& kv : fields) {
        const double v = kv.second;
        switch (kv.first) {
        case EffectField::Exposure:
            params.exposure = v;
            break;
        case EffectField::Contrast:
            params.contrast = v;
            break;
        case EffectField::Saturation:
            params.saturation = v;
            break;
        case EffectField::Sharpening:
            params.sharpen_strength = v;
            break;
        case EffectField::Highlights:
            params.highlight_shift = v;
            break;
        case EffectField::Shadows:
            params.shadow_shift = v;
            break;
        case EffectField::RedGain:
            params.white_balance.red = v;
            touches_white_balance = true;
            break;
        case EffectField::BlueGain:
            params.white_balance.blue = v;
            touches_white_balance = true;
            break;
        case EffectField::ClaheClip:
            params.clahe_clip_limit = v;
            break;
        case EffectField::DenoiseStrength:
            params.denoise_strength = static_cast<int>(std::lround(v));
            break;
        }
    }

    if (touches_white_balance) {
        params.white_balance.green = 1.0;
    }
}

// ============================================================================
// TelemetryMappingTable
// ============================================================================

bool TelemetryMappingTable::normalize()
{
    std::stable_sort(breakpoints.begin(), breakpoints.end(),
        [](const Breakpoint& a, const Breakpoint& b) { return a.at < b.at; });

    for (size_t i = 1; i < breakpoints.size(); ++i) {
        if (breakpoints[i].at == breakpoints[i - 1].at) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// TelemetryMappings
// ============================================================================

TelemetryMappings TelemetryMappings::builtin()
{
    TelemetryMappings m;

    // lux -> exposure/contrast
    TelemetryMappingTable ambient;
    ambient.policy = MappingPolicy::Linear;
    ambient.breakpoints = {
        make_breakpoint(0.0,     {{EffectField::Exposure, 1.8}, {EffectField::Contrast, 1.2}}),   // dark
        make_breakpoint(100.0,   {{EffectField::Exposure, 1.4}, {EffectField::Contrast, 1.1}}),   // dim indoor
        make_breakpoint(500.0,   {{EffectField::Exposure, 1.2}, {EffectField::Contrast, 1.0}}),   // normal indoor
        make_breakpoint(1000.0,  {{EffectField::Exposure, 1.0}, {EffectField::Contrast, 0.95}}),  // bright indoor
        make_breakpoint(10000.0, {{EffectField::Exposure, 0.8}, {EffectField::Contrast, 0.9}}),   // daylight
    };
    m.set_table(TelemetryKind::AmbientLight, ambient);

    // motion -> sharpening
    TelemetryMappingTable motion;
    motion.policy = MappingPolicy::Nearest;
    motion.breakpoints = {
        make_breakpoint(0.0, {{EffectField::Sharpening, 0.8}}),   // static
        make_breakpoint(0.3, {{EffectField::Sharpening, 0.6}}),   // slow
        make_breakpoint(0.6, {{EffectField::Sharpening, 0.4}}),   // medium
        make_breakpoint(1.0, {{EffectField::Sharpening, 0.2}}),   // fast
    };
    m.set_table(TelemetryKind::Motion, motion);

    // kelvin -> white balance
    TelemetryMappingTable temperature;
    temperature.policy = MappingPolicy::Linear;
    temperature.breakpoints = {
        make_breakpoint(2000.0, {{EffectField::RedGain, 1.3}, {EffectField::BlueGain, 0.7}}),    // candle
        make_breakpoint(3000.0, {{EffectField::RedGain, 1.1}, {EffectField::BlueGain, 0.85}}),   // tungsten
        make_breakpoint(5000.0, {{EffectField::RedGain, 1.0}, {EffectField::BlueGain, 1.0}}),    // daylight
        make_breakpoint(7000.0, {{EffectField::RedGain, 0.9}, {EffectField::BlueGain, 1.15}}),   // cloudy
    };
    m.set_table(TelemetryKind::ColorTemperature, temperature);

    return m;
}

bool TelemetryMappings::load_from_node(const YAML::Node& node)
{
    try {
        if (!node.IsMap()) {
            std::cerr << "telemetry_mappings must be a map of kind -> breakpoints" << std::endl;
            return false;
        }

        std::map<TelemetryKind, TelemetryMappingTable> loaded;

        for (const auto& kv : node) {
            const std::string kind_name = kv.first.as<std::string>();
            TelemetryKind kind;
            if (!parse_telemetry_kind(kind_name, kind)) {
                std::cerr << "Unknown telemetry kind in mappings: " << kind_name << std::endl;
                return false;
            }

            TelemetryMappingTable table;
            table.policy = default_policy(kind);

            if (kv.second.IsMap()) {
                if (kv.second["policy"]) {
                    const std::string policy = kv.second["policy"].as<std::string>();
                    if (policy == "linear") {
                        table.policy = MappingPolicy::Linear;
                    }
                    else if (policy == "nearest") {
                        table.policy = MappingPolicy::Nearest;
                    }
                    else {
                        std::cerr << "Mapping '" << kind_name << "' has unknown policy: " << policy << std::endl;
                        return false;
                    }
                }
                if (!kv.second["breakpoints"]) {
                    std::cerr << "Mapping '" << kind_name << "' is missing 'breakpoints'" << std::endl;
                    return false;
                }
            }

            const YAML::Node list = kv.second.IsMap() ? kv.second["breakpoints"] : kv.second;
            if (!parse_breakpoints(list, kind_name, table.breakpoints)) {
                return false;
            }

            if (!table.normalize()) {
                std::cerr << "Mapping '" << kind_name << "' has duplicate breakpoints" << std::endl;
                return false;
            }

            loaded[kind] = table;
        }

        for (const auto& kv : loaded) {
            tables_[kv.first] = kv.second;
        }
        return true;
    }
    catch (const YAML::Exception& e) {
        std::cerr << "Mapping table error: " << e.what() << std::endl;
        return false;
    }
}

void TelemetryMappings::set_table(TelemetryKind kind, const TelemetryMappingTable& table)
{
    tables_[kind] = table;
}

const TelemetryMappingTable* TelemetryMappings::find(TelemetryKind kind) const
{
    auto it = tables_.find(kind);
    if (it == tables_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace hdrtel
