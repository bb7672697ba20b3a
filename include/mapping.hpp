#pragma once

#include <map>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "parameters.hpp"
#include "telemetry.hpp"

namespace hdrtel {

/**
 * Parameter fields a telemetry mapping may drive
 */
enum class EffectField {
    Exposure,
    Contrast,
    Saturation,
    Sharpening,
    Highlights,
    Shadows,
    RedGain,
    BlueGain,
    ClaheClip,
    DenoiseStrength
};

const char* effect_field_name(EffectField field);

bool parse_effect_field(const std::string& name, EffectField& field);

/**
 * Partial parameter set attached to one breakpoint.
 * Fields not present leave the baseline untouched.
 */
struct ParameterEffect {
    std::map<EffectField, double> fields;

    bool has(EffectField field) const { return fields.count(field) != 0; }
    double get(EffectField field) const;
    void set(EffectField field, double value) { fields[field] = value; }
    bool empty() const { return fields.empty(); }

    /**
     * Overlay the defined fields onto params.
     * Red/blue gains set white balance with green pinned to 1.0.
     */
    void apply_to(EnhancementParameters& params) const;
};

/**
 * How a value between breakpoints is resolved
 */
enum class MappingPolicy {
    Linear,     // interpolate bracketing breakpoints
    Nearest     // snap to the closest breakpoint, ties go to the higher one
};

struct Breakpoint {
    double at;
    ParameterEffect effect;
};

/**
 * Ordered breakpoints for one telemetry kind, ascending by 'at'
 */
struct TelemetryMappingTable {
    MappingPolicy policy = MappingPolicy::Linear;
    std::vector<Breakpoint> breakpoints;

    /**
     * Sort breakpoints ascending
     * @return false on duplicate breakpoints
     */
    bool normalize();
};

/**
 * @brief Mapping tables for every telemetry kind
 *
 * Loaded once and read-only afterwards. A kind with no table degrades to
 * baseline behaviour for that kind only.
 */
class TelemetryMappings {
public:
    /**
     * Built-in tables for ambient light, motion level and colour temperature
     */
    static TelemetryMappings builtin();

    /**
     * @brief Replace tables from a YAML node
     *
     * Each key is a telemetry kind name holding either a breakpoint
     * sequence or a map with 'policy' and 'breakpoints'. Kinds not named
     * keep their current table.
     *
     * @return false on unknown kinds/fields, empty or duplicate breakpoints
     */
    bool load_from_node(const YAML::Node& node);

    void set_table(TelemetryKind kind, const TelemetryMappingTable& table);

    // nullptr when the kind has no table
    const TelemetryMappingTable* find(TelemetryKind kind) const;

    const std::map<TelemetryKind, TelemetryMappingTable>& tables() const { return tables_; }

private:
    std::map<TelemetryKind, TelemetryMappingTable> tables_;
};

} // namespace hdrtel
