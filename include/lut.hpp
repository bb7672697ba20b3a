#pragma once

#include <array>
#include <cstdint>
#include <memory>

namespace hdrtel {

/**
 * @file lut.hpp
 * @brief Precomputed 8-bit transfer curves
 *
 * Per-pixel transcendental evaluation (pow, exp) is far too slow for
 * near-real-time frames, so every curve the pipeline needs is quantized
 * once into a 256-entry byte table and applied with a single index.
 */

using Lut8 = std::array<uint8_t, 256>;

/**
 * Immutable set of transfer curves shared by every frame of a processor.
 * Safe to share read-only between processors with the same knee.
 */
struct LookupTableBank {
    Lut8 gamma_decode;     // round(255 * x^2.2)
    Lut8 gamma_encode;     // round(255 * x^(1/2.2))
    Lut8 s_curve;          // round(255 * sigmoid(12 * (x - 0.5)))
    Lut8 highlight_knee;   // identity below knee, Reinhard roll-off above
    double knee;

    static constexpr double kGamma = 2.2;
    static constexpr double kSCurveSteepness = 12.0;
    static constexpr double kDefaultKnee = 0.7;

    /**
     * Build all four tables
     * @param knee Highlight compression start in [0, 1]
     */
    static LookupTableBank build(double knee = kDefaultKnee);

    /**
     * Build once and hand out a shared read-only instance
     */
    static std::shared_ptr<const LookupTableBank> build_shared(double knee = kDefaultKnee);
};

/**
 * Quantize a normalized value to a byte with rounding and clamping
 */
uint8_t quantize_unit(double x);

} // namespace hdrtel
