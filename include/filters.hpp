#pragma once

#include <opencv2/core.hpp>
#include "frame.hpp"
#include "lut.hpp"
#include "parameters.hpp"

namespace hdrtel {

/**
 * @file filters.hpp
 * @brief OpenCV image operators used by the frame pipeline
 *
 * Operators take 8-bit BGR images (CV_8UC3) and write the result back
 * into the same buffer. Every float-to-byte step goes through OpenCV's
 * saturate_cast, so values round and clamp to [0, 255] instead of wrapping.
 */

/**
 * @brief Non-owning CV_8UC3 header over a frame's buffer
 *
 * The frame must outlive the returned Mat and must not be resized while
 * the header is in use.
 */
cv::Mat frame_view(Frame& frame);

/**
 * 1x256 CV_8U table for cv::LUT
 */
cv::Mat lut_mat(const Lut8& lut);

void apply_lut(cv::Mat& image, const Lut8& lut);

/**
 * Curve from the cumulative distribution of the image's gray histogram
 */
Lut8 build_adaptive_tone_curve(const cv::Mat& bgr);

/**
 * Scale the red and blue channels; green is the reference and untouched
 */
void scale_red_blue(cv::Mat& bgr, double red_gain, double blue_gain);

/**
 * @brief CLAHE and exposure on the Lab lightness channel
 *
 * The a/b channels pass through untouched. The tile grid is capped at the
 * image dimensions. A clip_limit <= 0 disables clipping, which makes
 * each tile a plain histogram equalization.
 */
void equalize_lightness(cv::Mat& bgr, double clip_limit, const GridSize& grid, double exposure);

/**
 * Scale the HSV saturation channel by gain
 */
void scale_saturation(cv::Mat& bgr, double gain);

/**
 * bgr * (1 + strength) - GaussianBlur(bgr, sigma) * strength
 */
void unsharp_mask(cv::Mat& bgr, double strength, double sigma = 2.0);

/**
 * Scale pixels by 1 + shift * mask where the masks ramp from mid-grey
 * towards white (highlights) or black (shadows)
 */
void adjust_highlights_shadows(cv::Mat& bgr, double highlight_shift, double shadow_shift);

/**
 * @brief Colour non-local means denoise
 *
 * Filter strength h = hColor = strength with a 7x7 template and a 21x21
 * search window. Smoothing grows with strength; 0 is a no-op.
 */
void denoise_colored(cv::Mat& bgr, int strength);

} // namespace hdrtel
