/**
 * @file lut.cpp
 * @brief Lookup table construction
 */

#include "lut.hpp"
#include <algorithm>
#include <cmath>

namespace hdrtel {

constexpr double LookupTableBank::kGamma;
constexpr double LookupTableBank::kSCurveSteepness;
constexpr double LookupTableBank::kDefaultKnee;

uint8_t quantize_unit(double x)
{
    const double scaled = std::round(255.0 * x);
    if (!(scaled > 0.0)) {
        return 0;
    }
    if (scaled >= 255.0) {
        return 255;
    }
    return static_cast<uint8_t>(scaled);
}

namespace {

double sigmoid(double z)
{
    return 1.0 / (1.0 + std::exp(-z));
}

double reinhard_knee(double x, double knee)
{
    if (x <= knee) {
        return x;
    }
    const double over = x - knee;
    return knee + over / (1.0 + over);
}

} // anonymous namespace

LookupTableBank LookupTableBank::build(double knee)
{
    LookupTableBank bank;
    bank.knee = std::max(0.0, std::min(1.0, knee));

    for (int i = 0; i < 256; ++i) {
        const double x = i / 255.0;
        bank.gamma_decode[i] = quantize_unit(std::pow(x, kGamma));
        bank.gamma_encode[i] = quantize_unit(std::pow(x, 1.0 / kGamma));
        bank.s_curve[i] = quantize_unit(sigmoid(kSCurveSteepness * (x - 0.5)));
        bank.highlight_knee[i] = quantize_unit(reinhard_knee(x, bank.knee));
    }

    return bank;
}

std::shared_ptr<const LookupTableBank> LookupTableBank::build_shared(double knee)
{
    return std::make_shared<const LookupTableBank>(build(knee));
}

} // namespace hdrtel
