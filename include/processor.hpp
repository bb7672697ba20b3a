#pragma once

#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include "frame.hpp"
#include "interpolator.hpp"
#include "lut.hpp"
#include "parameters.hpp"
#include "presets.hpp"
#include "stats.hpp"
#include "telemetry.hpp"

namespace hdrtel {

/**
 * @brief Telemetry-adaptive HDR frame processor
 *
 * Turns one 8-bit BGR frame into one enhanced frame through a fixed
 * stage order:
 *  1. gamma decode           7. saturation (HSV)
 *  2. white balance          8. unsharp mask
 *  3. CLAHE on Lab L         9. highlight/shadow shift
 *  4. exposure on L         10. denoise
 *  5. Lab -> BGR            11. gamma encode
 *  6. tone curve            12. metrics
 *
 * Holds mutable parameters and latency totals, so at most one call to
 * process() may run per instance at a time. The lookup tables are
 * immutable and may be shared between instances.
 */
class HdrProcessor {
public:
    /**
     * @brief Construct processor for a preset
     * @param preset Preset id; unknown ids keep the hard-coded defaults
     * @param presets Preset definitions
     * @param mappings Telemetry mapping tables
     * @param luts Shared tables, built with the default knee when null
     */
    HdrProcessor(const std::string& preset,
                 const PresetTable& presets = PresetTable::builtin(),
                 const TelemetryMappings& mappings = TelemetryMappings::builtin(),
                 std::shared_ptr<const LookupTableBank> luts = nullptr);

    /**
     * @brief Process a single frame
     *
     * When telemetry is given it is layered onto the current parameters
     * first; otherwise the current parameters are reused unchanged.
     *
     * @param input 8-bit 3-channel BGR frame, not modified
     * @param telemetry Latest snapshot or nullptr
     * @param output Enhanced frame with the input's dimensions (output)
     * @param metrics Timing and parameters used (output)
     * @throws InvalidFrameFormat on wrong channel count, zero size or a
     *         buffer that does not match the dimensions
     */
    void process(const Frame& input,
                 const TelemetrySnapshot* telemetry,
                 Frame& output,
                 ProcessingMetrics& metrics);

    /**
     * Apply a snapshot to the held parameters without processing a frame
     */
    void update_parameters(const TelemetrySnapshot& telemetry);

    const EnhancementParameters& parameters() const { return params_; }

    void set_parameters(const EnhancementParameters& params);

    const MetricsAccumulator& metrics() const { return accumulator_; }

    const LookupTableBank& lookup_tables() const { return *luts_; }

    const std::string& preset() const { return preset_; }

    // False when the preset id was not found and defaults are in use
    bool preset_found() const { return preset_found_; }

    static void validate_frame(const Frame& frame);

private:
    void gamma_decode(cv::Mat& image) const;
    void white_balance(cv::Mat& image) const;
    void local_contrast_and_exposure(cv::Mat& image) const;
    void tone_curve(cv::Mat& image) const;
    void saturation(cv::Mat& image) const;
    void detail(cv::Mat& image) const;
    void highlights_shadows(cv::Mat& image) const;
    void denoise(cv::Mat& image) const;
    void gamma_encode(cv::Mat& image) const;

    std::string preset_;
    bool preset_found_;
    EnhancementParameters params_;
    ParameterInterpolator interpolator_;
    std::shared_ptr<const LookupTableBank> luts_;
    MetricsAccumulator accumulator_;

    static constexpr double kDetailSigma = 2.0;
};

} // namespace hdrtel
