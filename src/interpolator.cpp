/**
 * @file interpolator.cpp
 * @brief Piecewise-linear / nearest-neighbour telemetry interpolation
 */

#include "interpolator.hpp"
#include <algorithm>
#include <cmath>

namespace hdrtel {

ParameterInterpolator::ParameterInterpolator(const TelemetryMappings& mappings)
    : mappings_(mappings)
{
}

EnhancementParameters ParameterInterpolator::interpolate(
    const EnhancementParameters& baseline,
    const TelemetrySnapshot& snapshot) const
{
    EnhancementParameters params = baseline;

    for (const auto& entry : snapshot.readings()) {
        ParameterEffect effect;
        if (effect_for(entry.first, entry.second.value, effect)) {
            effect.apply_to(params);
        }
    }

    params.clamp_to_sane_range();
    return params;
}

bool ParameterInterpolator::effect_for(TelemetryKind kind, double value, ParameterEffect& effect) const
{
    const TelemetryMappingTable* table = mappings_.find(kind);
    if (!table || table->breakpoints.empty()) {
        return false;
    }

    // Bad sensor data is ignored for this kind only
    if (!std::isfinite(value)) {
        return false;
    }

    if (table->policy == MappingPolicy::Nearest) {
        effect = resolve_nearest(*table, value);
    }
    else {
        effect = resolve_linear(*table, value);
    }
    return true;
}

ParameterEffect ParameterInterpolator::resolve_linear(const TelemetryMappingTable& table, double value)
{
    const std::vector<Breakpoint>& bps = table.breakpoints;

    if (value <= bps.front().at) {
        return bps.front().effect;
    }
    if (value >= bps.back().at) {
        return bps.back().effect;
    }

    // First breakpoint strictly above value; its predecessor is <= value
    auto upper = std::upper_bound(bps.begin(), bps.end(), value,
        [](double v, const Breakpoint& bp) { return v < bp.at; });
    const Breakpoint& hi = *upper;
    const Breakpoint& lo = *(upper - 1);

    if (value == lo.at) {
        return lo.effect;
    }

    const double t = (value - lo.at) / (hi.at - lo.at);

    ParameterEffect blended;
    for (const auto& kv : lo.effect.fields) {
        if (!hi.effect.has(kv.first)) {
            continue;
        }
        const double a = kv.second;
        const double b = hi.effect.get(kv.first);
        blended.set(kv.first, a * (1.0 - t) + b * t);
    }
    return blended;
}

ParameterEffect ParameterInterpolator::resolve_nearest(const TelemetryMappingTable& table, double value)
{
    const std::vector<Breakpoint>& bps = table.breakpoints;

    size_t best = 0;
    double best_distance = std::abs(value - bps[0].at);

    // Ascending scan with <= lets the higher breakpoint win a tie
    for (size_t i = 1; i < bps.size(); ++i) {
        const double distance = std::abs(value - bps[i].at);
        if (distance <= best_distance) {
            best = i;
            best_distance = distance;
        }
    }
    return bps[best].effect;
}

} // namespace hdrtel
