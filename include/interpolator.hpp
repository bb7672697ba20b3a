#pragma once

#include "mapping.hpp"
#include "parameters.hpp"
#include "telemetry.hpp"

namespace hdrtel {

/**
 * @brief Telemetry-to-parameter interpolator
 *
 * For each kind present in a snapshot:
 * - values at or beyond the outer breakpoints take that breakpoint's effect
 * - Linear tables blend the bracketing pair for fields both define
 * - Nearest tables copy the closest breakpoint, ties go to the higher one
 * Fields no table defines keep their baseline value. The result is clamped
 * to sane ranges before it reaches the pipeline.
 */
class ParameterInterpolator {
public:
    explicit ParameterInterpolator(const TelemetryMappings& mappings);

    /**
     * Layer a snapshot on top of baseline parameters
     * @param baseline Current parameters (preset or previous update)
     * @param snapshot Latest telemetry, not modified
     * @return Adjusted, range-clamped parameters
     */
    EnhancementParameters interpolate(
        const EnhancementParameters& baseline,
        const TelemetrySnapshot& snapshot) const;

    /**
     * Resolve the effect of a single reading
     * @return false if the kind has no usable table or the value is not finite
     */
    bool effect_for(TelemetryKind kind, double value, ParameterEffect& effect) const;

    const TelemetryMappings& mappings() const { return mappings_; }

private:
    static ParameterEffect resolve_linear(const TelemetryMappingTable& table, double value);
    static ParameterEffect resolve_nearest(const TelemetryMappingTable& table, double value);

    TelemetryMappings mappings_;
};

} // namespace hdrtel
