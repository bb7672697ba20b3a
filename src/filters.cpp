/**
 * @file filters.cpp
 * @brief OpenCV image operators
 */

#include "filters.hpp"
#include <algorithm>
#include <vector>
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

namespace hdrtel {

namespace {

// Clamp a CV_32F image to [0, 1]
void clip_unit(cv::Mat& values)
{
    cv::threshold(values, values, 1.0, 1.0, cv::THRESH_TRUNC);
    cv::threshold(values, values, 0.0, 0.0, cv::THRESH_TOZERO);
}

} // anonymous namespace

cv::Mat frame_view(Frame& frame)
{
    return cv::Mat(static_cast<int>(frame.height), static_cast<int>(frame.width),
                   CV_8UC3, frame.data.data());
}

cv::Mat lut_mat(const Lut8& lut)
{
    cv::Mat table(1, 256, CV_8U);
    std::copy(lut.begin(), lut.end(), table.ptr<uint8_t>());
    return table;
}

void apply_lut(cv::Mat& image, const Lut8& lut)
{
    cv::LUT(image, lut_mat(lut), image);
}

Lut8 build_adaptive_tone_curve(const cv::Mat& bgr)
{
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

    const int channels[] = {0};
    const int hist_size[] = {256};
    const float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    cv::Mat hist;
    cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);

    const double total = static_cast<double>(gray.total());

    Lut8 curve{};
    double cumulative = 0.0;
    for (int i = 0; i < 256; ++i) {
        cumulative += hist.at<float>(i);
        curve[i] = quantize_unit(total > 0.0 ? cumulative / total : 0.0);
    }
    return curve;
}

void scale_red_blue(cv::Mat& bgr, double red_gain, double blue_gain)
{
    std::vector<cv::Mat> channels;
    cv::split(bgr, channels);

    channels[0].convertTo(channels[0], -1, blue_gain);
    channels[2].convertTo(channels[2], -1, red_gain);

    cv::merge(channels, bgr);
}

void equalize_lightness(cv::Mat& bgr, double clip_limit, const GridSize& grid, double exposure)
{
    cv::Mat lab;
    cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);

    std::vector<cv::Mat> channels;
    cv::split(lab, channels);

    const cv::Size tiles(std::max(1, std::min(grid.cols, bgr.cols)),
                         std::max(1, std::min(grid.rows, bgr.rows)));
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(std::max(clip_limit, 0.0), tiles);

    cv::Mat lightness;
    clahe->apply(channels[0], lightness);

    if (exposure != 1.0) {
        lightness.convertTo(lightness, -1, exposure);
    }
    channels[0] = lightness;

    cv::merge(channels, lab);
    cv::cvtColor(lab, bgr, cv::COLOR_Lab2BGR);
}

void scale_saturation(cv::Mat& bgr, double gain)
{
    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

    std::vector<cv::Mat> channels;
    cv::split(hsv, channels);
    channels[1].convertTo(channels[1], -1, gain);
    cv::merge(channels, hsv);

    cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
}

void unsharp_mask(cv::Mat& bgr, double strength, double sigma)
{
    if (strength <= 0.0) {
        return;
    }

    cv::Mat blurred;
    cv::GaussianBlur(bgr, blurred, cv::Size(0, 0), sigma);
    cv::addWeighted(bgr, 1.0 + strength, blurred, -strength, 0.0, bgr);
}

void adjust_highlights_shadows(cv::Mat& bgr, double highlight_shift, double shadow_shift)
{
    if (highlight_shift == 0.0 && shadow_shift == 0.0) {
        return;
    }

    cv::Mat unit;
    bgr.convertTo(unit, CV_32F, 1.0 / 255.0);

    cv::Mat lum;
    cv::cvtColor(unit, lum, cv::COLOR_BGR2GRAY);

    cv::Mat gain(lum.size(), CV_32F, cv::Scalar(1.0));

    if (highlight_shift != 0.0) {
        cv::Mat mask = (lum - 0.5) * 2.0;
        clip_unit(mask);
        cv::Mat factor = 1.0 + highlight_shift * mask;
        gain = gain.mul(factor);
    }
    if (shadow_shift != 0.0) {
        cv::Mat mask = (0.5 - lum) * 2.0;
        clip_unit(mask);
        cv::Mat factor = 1.0 + shadow_shift * mask;
        gain = gain.mul(factor);
    }

    // Same gain on every channel of a pixel
    cv::Mat gain_bgr;
    cv::merge(std::vector<cv::Mat>{gain, gain, gain}, gain_bgr);
    cv::multiply(unit, gain_bgr, unit);

    unit.convertTo(bgr, CV_8U, 255.0);
}

void denoise_colored(cv::Mat& bgr, int strength)
{
    if (strength <= 0) {
        return;
    }

    const float h = static_cast<float>(strength);
    cv::Mat denoised;
    cv::fastNlMeansDenoisingColored(bgr, denoised, h, h, 7, 21);
    denoised.copyTo(bgr);
}

} // namespace hdrtel
