/**
 * @file processor.cpp
 * @brief Telemetry-adaptive HDR frame pipeline
 *
 * Stage order matters: white balance and exposure are multiplicative and
 * run on gamma-decoded data; equalization touches only the Lab lightness
 * channel so it cannot shift colours; gamma encode is always last.
 */

#include "processor.hpp"
#include "filters.hpp"
#include <chrono>
#include <sstream>
#include <utility>

namespace hdrtel {

constexpr double HdrProcessor::kDetailSigma;

HdrProcessor::HdrProcessor(const std::string& preset,
                           const PresetTable& presets,
                           const TelemetryMappings& mappings,
                           std::shared_ptr<const LookupTableBank> luts)
    : preset_(preset)
    , preset_found_(false)
    , interpolator_(mappings)
    , luts_(luts ? luts : LookupTableBank::build_shared())
{
    const PresetDefinition* definition = presets.find(preset);
    if (definition) {
        params_ = EnhancementParameters::from_preset(*definition);
        preset_found_ = true;
    }
}

void HdrProcessor::validate_frame(const Frame& frame)
{
    if (frame.channels != 3) {
        std::ostringstream oss;
        oss << "expected 3-channel BGR frame, got " << frame.channels << " channels";
        throw InvalidFrameFormat(oss.str());
    }
    if (frame.width == 0 || frame.height == 0) {
        throw InvalidFrameFormat("zero-sized frame");
    }
    if (frame.data.size() != frame.byte_count()) {
        std::ostringstream oss;
        oss << "frame buffer holds " << frame.data.size() << " bytes, "
            << frame.width << "x" << frame.height << "x3 needs " << frame.byte_count();
        throw InvalidFrameFormat(oss.str());
    }
}

void HdrProcessor::update_parameters(const TelemetrySnapshot& telemetry)
{
    params_ = interpolator_.interpolate(params_, telemetry);
}

void HdrProcessor::set_parameters(const EnhancementParameters& params)
{
    params_ = params;
    params_.clamp_to_sane_range();
}

void HdrProcessor::process(const Frame& input,
                           const TelemetrySnapshot* telemetry,
                           Frame& output,
                           ProcessingMetrics& metrics)
{
    validate_frame(input);

    if (telemetry) {
        update_parameters(*telemetry);
    }

    const auto start = std::chrono::high_resolution_clock::now();

    Frame frame = input;
    cv::Mat image = frame_view(frame);

    gamma_decode(image);
    white_balance(image);
    local_contrast_and_exposure(image);
    tone_curve(image);
    saturation(image);
    detail(image);
    highlights_shadows(image);
    denoise(image);
    gamma_encode(image);

    const auto end = std::chrono::high_resolution_clock::now();
    const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    accumulator_.record(elapsed_ms);

    metrics.frame_index = input.frame_index;
    metrics.process_time_ms = elapsed_ms;
    metrics.average_time_ms = accumulator_.average();
    metrics.frame_count = accumulator_.frame_count();
    metrics.parameters = params_;

    output = std::move(frame);
}

// ============================================================================
// Stages
// ============================================================================

void HdrProcessor::gamma_decode(cv::Mat& image) const
{
    apply_lut(image, luts_->gamma_decode);
}

void HdrProcessor::white_balance(cv::Mat& image) const
{
    const WhiteBalanceGain& wb = params_.white_balance;
    if (wb.is_identity()) {
        return;
    }
    scale_red_blue(image, wb.red, wb.blue);
}

void HdrProcessor::local_contrast_and_exposure(cv::Mat& image) const
{
    equalize_lightness(image, params_.clahe_clip_limit, params_.clahe_grid, params_.exposure);
}

void HdrProcessor::tone_curve(cv::Mat& image) const
{
    switch (params_.tone_curve) {
    case ToneCurve::Linear:
        break;
    case ToneCurve::SCurve:
        apply_lut(image, luts_->s_curve);
        break;
    case ToneCurve::Adaptive: {
        // Histogram + CDF per frame; the only per-frame statistic in the pipeline
        const Lut8 curve = build_adaptive_tone_curve(image);
        apply_lut(image, curve);
        break;
    }
    }
}

void HdrProcessor::saturation(cv::Mat& image) const
{
    if (params_.saturation != 1.0) {
        scale_saturation(image, params_.saturation);
    }
}

void HdrProcessor::detail(cv::Mat& image) const
{
    if (params_.sharpen_strength > 0.0) {
        unsharp_mask(image, params_.sharpen_strength, kDetailSigma);
    }
}

void HdrProcessor::highlights_shadows(cv::Mat& image) const
{
    adjust_highlights_shadows(image, params_.highlight_shift, params_.shadow_shift);
}

void HdrProcessor::denoise(cv::Mat& image) const
{
    if (params_.denoise_strength > 0) {
        denoise_colored(image, params_.denoise_strength);
    }
}

void HdrProcessor::gamma_encode(cv::Mat& image) const
{
    apply_lut(image, luts_->gamma_encode);
}

} // namespace hdrtel
