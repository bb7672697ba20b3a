/**
 * @file parameters.cpp
 * @brief Enhancement parameter defaults, preset baselines and range clamping
 */

#include "parameters.hpp"
#include <algorithm>
#include <cmath>

namespace hdrtel {

constexpr double EnhancementParameters::kMaxGain;
constexpr double EnhancementParameters::kMaxClipLimit;
constexpr int EnhancementParameters::kMaxGridSize;
constexpr int EnhancementParameters::kMaxDenoiseStrength;

const char* tone_curve_name(ToneCurve curve)
{
    switch (curve) {
    case ToneCurve::Linear:
        return "linear";
    case ToneCurve::SCurve:
        return "s_curve";
    case ToneCurve::Adaptive:
        return "adaptive";
    }
    return "unknown";
}

bool parse_tone_curve(const std::string& name, ToneCurve& curve)
{
    if (name == "linear") {
        curve = ToneCurve::Linear;
        return true;
    }
    if (name == "s_curve") {
        curve = ToneCurve::SCurve;
        return true;
    }
    if (name == "adaptive") {
        curve = ToneCurve::Adaptive;
        return true;
    }
    return false;
}

EnhancementParameters EnhancementParameters::from_preset(const PresetDefinition& preset)
{
    EnhancementParameters params;
    params.clahe_clip_limit = preset.clahe_clip_limit;
    params.clahe_grid = preset.clahe_grid;
    params.saturation = preset.saturation;
    params.sharpen_strength = preset.sharpen_strength;
    params.tone_curve = preset.tone_curve;
    params.denoise_strength = preset.denoise_enabled ? preset.denoise_strength : 0;
    params.clamp_to_sane_range();
    return params;
}

namespace {

double clamp_or(double value, double lo, double hi, double fallback)
{
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::max(lo, std::min(hi, value));
}

} // anonymous namespace

void EnhancementParameters::clamp_to_sane_range()
{
    exposure = clamp_or(exposure, 0.0, kMaxGain, 1.0);
    contrast = clamp_or(contrast, 0.0, kMaxGain, 1.0);
    saturation = clamp_or(saturation, 0.0, kMaxGain, 1.0);
    white_balance.red = clamp_or(white_balance.red, 0.0, kMaxGain, 1.0);
    white_balance.green = clamp_or(white_balance.green, 0.0, kMaxGain, 1.0);
    white_balance.blue = clamp_or(white_balance.blue, 0.0, kMaxGain, 1.0);

    sharpen_strength = clamp_or(sharpen_strength, 0.0, 1.0, 0.0);
    highlight_shift = clamp_or(highlight_shift, -1.0, 1.0, 0.0);
    shadow_shift = clamp_or(shadow_shift, -1.0, 1.0, 0.0);

    clahe_clip_limit = clamp_or(clahe_clip_limit, 0.0, kMaxClipLimit, 3.0);
    clahe_grid.cols = std::max(1, std::min(kMaxGridSize, clahe_grid.cols));
    clahe_grid.rows = std::max(1, std::min(kMaxGridSize, clahe_grid.rows));
    denoise_strength = std::max(0, std::min(kMaxDenoiseStrength, denoise_strength));
}

bool EnhancementParameters::operator==(const EnhancementParameters& other) const
{
    return exposure == other.exposure
        && contrast == other.contrast
        && saturation == other.saturation
        && sharpen_strength == other.sharpen_strength
        && highlight_shift == other.highlight_shift
        && shadow_shift == other.shadow_shift
        && white_balance.red == other.white_balance.red
        && white_balance.green == other.white_balance.green
        && white_balance.blue == other.white_balance.blue
        && tone_curve == other.tone_curve
        && denoise_strength == other.denoise_strength
        && clahe_clip_limit == other.clahe_clip_limit
        && clahe_grid.cols == other.clahe_grid.cols
        && clahe_grid.rows == other.clahe_grid.rows;
}

} // namespace hdrtel
