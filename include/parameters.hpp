#pragma once

#include <cstdint>
#include <string>

namespace hdrtel {

/**
 * Tone curve applied after the luminance stage.
 * Closed set; configuration names outside it are rejected at load time.
 */
enum class ToneCurve {
    Linear,     // no-op
    SCurve,     // precomputed sigmoid table
    Adaptive    // per-frame histogram CDF
};

const char* tone_curve_name(ToneCurve curve);

bool parse_tone_curve(const std::string& name, ToneCurve& curve);

/**
 * Per-channel white balance gains (red, green, blue)
 */
struct WhiteBalanceGain {
    double red = 1.0;
    double green = 1.0;
    double blue = 1.0;

    bool is_identity() const {
        return red == 1.0 && green == 1.0 && blue == 1.0;
    }
};

/**
 * CLAHE tile grid (columns x rows)
 */
struct GridSize {
    int cols = 8;
    int rows = 8;
};

/**
 * Named baseline selected by preset id
 */
struct PresetDefinition {
    std::string name;
    double clahe_clip_limit = 3.0;
    GridSize clahe_grid;
    double saturation = 1.1;
    double sharpen_strength = 0.6;
    ToneCurve tone_curve = ToneCurve::SCurve;
    bool denoise_enabled = false;
    int denoise_strength = 0;
};

/**
 * @brief Numeric controls consumed by the frame pipeline
 *
 * Recomputed every frame from the current values plus the latest
 * telemetry snapshot.
 */
struct EnhancementParameters {
    double exposure = 1.0;          // gain on the L channel
    double contrast = 1.0;          // derived from ambient light, reported only
    double saturation = 1.1;        // gain on HSV saturation
    double sharpen_strength = 0.6;  // unsharp-mask weight, 0 disables
    double highlight_shift = 0.0;
    double shadow_shift = 0.0;
    WhiteBalanceGain white_balance;
    ToneCurve tone_curve = ToneCurve::SCurve;
    int denoise_strength = 5;       // 0 disables
    double clahe_clip_limit = 3.0;
    GridSize clahe_grid;

    // Sane ranges enforced after interpolation
    static constexpr double kMaxGain = 3.0;
    static constexpr double kMaxClipLimit = 40.0;
    static constexpr int kMaxGridSize = 64;
    static constexpr int kMaxDenoiseStrength = 30;

    /**
     * Baseline parameters for a preset
     */
    static EnhancementParameters from_preset(const PresetDefinition& preset);

    /**
     * Pin every field to its physically sane range:
     * gains [0, 3], sharpening [0, 1], shifts [-1, 1], clip [0, 40],
     * grid [1, 64], denoise [0, 30]. Non-finite values fall back to defaults.
     */
    void clamp_to_sane_range();

    bool operator==(const EnhancementParameters& other) const;
    bool operator!=(const EnhancementParameters& other) const { return !(*this == other); }
};

} // namespace hdrtel
