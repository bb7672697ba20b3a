#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include "interpolator.hpp"
#include "presets.hpp"

using namespace hdrtel;

namespace {

TelemetrySnapshot snapshot_of(TelemetryKind kind, double value)
{
    TelemetrySnapshot snapshot;
    snapshot.set(TelemetryReading(kind, value));
    return snapshot;
}

EnhancementParameters balanced_baseline()
{
    return EnhancementParameters::from_preset(*PresetTable::builtin().find("balanced"));
}

} // anonymous namespace

TEST_CASE("Ambient light below the first breakpoint takes the boundary effect", "[interpolator][clamp]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());

    const EnhancementParameters p = interp.interpolate(
        balanced_baseline(), snapshot_of(TelemetryKind::AmbientLight, -250.0));
    REQUIRE(p.exposure == 1.8);
    REQUIRE(p.contrast == 1.2);
}

TEST_CASE("Ambient light above the last breakpoint takes the boundary effect", "[interpolator][clamp]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());

    const EnhancementParameters p = interp.interpolate(
        balanced_baseline(), snapshot_of(TelemetryKind::AmbientLight, 250000.0));
    REQUIRE(p.exposure == 0.8);
    REQUIRE(p.contrast == 0.9);
}

TEST_CASE("Values exactly on a breakpoint reproduce its effect", "[interpolator][anchor]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());
    const EnhancementParameters base = balanced_baseline();

    REQUIRE(interp.interpolate(base, snapshot_of(TelemetryKind::AmbientLight, 100.0)).exposure == 1.4);
    REQUIRE(interp.interpolate(base, snapshot_of(TelemetryKind::AmbientLight, 500.0)).exposure == 1.2);
    REQUIRE(interp.interpolate(base, snapshot_of(TelemetryKind::AmbientLight, 1000.0)).contrast == 0.95);

    const EnhancementParameters wb = interp.interpolate(base, snapshot_of(TelemetryKind::ColorTemperature, 3000.0));
    REQUIRE(wb.white_balance.red == 1.1);
    REQUIRE(wb.white_balance.blue == 0.85);
}

TEST_CASE("Halfway between two breakpoints blends linearly", "[interpolator][linear]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());

    const EnhancementParameters p = interp.interpolate(
        balanced_baseline(), snapshot_of(TelemetryKind::AmbientLight, 750.0));
    REQUIRE(p.exposure == Approx(1.1));
    REQUIRE(p.contrast == Approx(0.975));
}

TEST_CASE("Colour temperature drives red/blue gains with green pinned", "[interpolator][white_balance]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());

    EnhancementParameters base = balanced_baseline();
    base.white_balance.green = 1.7;

    const EnhancementParameters p = interp.interpolate(base, snapshot_of(TelemetryKind::ColorTemperature, 2500.0));
    REQUIRE(p.white_balance.red == Approx(1.2));
    REQUIRE(p.white_balance.blue == Approx(0.775));
    REQUIRE(p.white_balance.green == 1.0);
}

TEST_CASE("Motion snaps to the nearest breakpoint", "[interpolator][nearest]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());
    const EnhancementParameters base = balanced_baseline();

    SECTION("close to a breakpoint") {
        REQUIRE(interp.interpolate(base, snapshot_of(TelemetryKind::Motion, 0.35)).sharpen_strength == 0.6);
        REQUIRE(interp.interpolate(base, snapshot_of(TelemetryKind::Motion, 0.9)).sharpen_strength == 0.2);
    }

    SECTION("midpoint between 0.3 and 0.6 selects 0.6") {
        REQUIRE(interp.interpolate(base, snapshot_of(TelemetryKind::Motion, 0.45)).sharpen_strength == 0.4);
    }

    SECTION("never blends") {
        const double s = interp.interpolate(base, snapshot_of(TelemetryKind::Motion, 0.5)).sharpen_strength;
        REQUIRE(s == 0.4);
    }
}

TEST_CASE("Exact ties go to the higher breakpoint", "[interpolator][nearest]") {
    TelemetryMappingTable table;
    table.policy = MappingPolicy::Nearest;
    Breakpoint low;
    low.at = 0.25;
    low.effect.set(EffectField::Sharpening, 0.1);
    Breakpoint high;
    high.at = 0.75;
    high.effect.set(EffectField::Sharpening, 0.9);
    table.breakpoints = {low, high};

    TelemetryMappings mappings;
    mappings.set_table(TelemetryKind::Motion, table);
    ParameterInterpolator interp(mappings);

    ParameterEffect effect;
    REQUIRE(interp.effect_for(TelemetryKind::Motion, 0.5, effect));
    REQUIRE(effect.get(EffectField::Sharpening) == 0.9);
}

TEST_CASE("Empty snapshot leaves the baseline unchanged", "[interpolator]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());
    const EnhancementParameters base = balanced_baseline();

    REQUIRE(interp.interpolate(base, TelemetrySnapshot()) == base);
}

TEST_CASE("Fields a table does not define keep their baseline value", "[interpolator][partial]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());
    const EnhancementParameters base = balanced_baseline();

    const EnhancementParameters p = interp.interpolate(base, snapshot_of(TelemetryKind::AmbientLight, 300.0));
    REQUIRE(p.saturation == base.saturation);
    REQUIRE(p.sharpen_strength == base.sharpen_strength);
    REQUIRE(p.tone_curve == base.tone_curve);
    REQUIRE(p.denoise_strength == base.denoise_strength);
    REQUIRE(p.white_balance.is_identity());
}

TEST_CASE("Only fields defined at both bracketing breakpoints are blended", "[interpolator][partial]") {
    TelemetryMappingTable table;
    Breakpoint a;
    a.at = 0.0;
    a.effect.set(EffectField::Exposure, 1.0);
    a.effect.set(EffectField::Saturation, 2.0);
    Breakpoint b;
    b.at = 100.0;
    b.effect.set(EffectField::Exposure, 2.0);
    table.breakpoints = {a, b};

    TelemetryMappings mappings;
    mappings.set_table(TelemetryKind::AmbientLight, table);
    ParameterInterpolator interp(mappings);

    const EnhancementParameters base = balanced_baseline();
    const EnhancementParameters p = interp.interpolate(base, snapshot_of(TelemetryKind::AmbientLight, 25.0));
    REQUIRE(p.exposure == Approx(1.25));
    REQUIRE(p.saturation == base.saturation);
}

TEST_CASE("Single-breakpoint table always applies its effect", "[interpolator]") {
    TelemetryMappingTable table;
    Breakpoint only;
    only.at = 400.0;
    only.effect.set(EffectField::Exposure, 1.5);
    table.breakpoints = {only};

    TelemetryMappings mappings;
    mappings.set_table(TelemetryKind::AmbientLight, table);
    ParameterInterpolator interp(mappings);

    const EnhancementParameters base = balanced_baseline();
    for (double lux : {-10.0, 0.0, 400.0, 9000.0}) {
        REQUIRE(interp.interpolate(base, snapshot_of(TelemetryKind::AmbientLight, lux)).exposure == 1.5);
    }
}

TEST_CASE("A kind without a mapping table degrades to baseline for that kind only", "[interpolator][degrade]") {
    TelemetryMappings mappings = TelemetryMappings::builtin();
    TelemetryMappings ambient_only;
    ambient_only.set_table(TelemetryKind::AmbientLight, *mappings.find(TelemetryKind::AmbientLight));
    ParameterInterpolator interp(ambient_only);

    TelemetrySnapshot snapshot;
    snapshot.set(TelemetryReading(TelemetryKind::AmbientLight, 500.0));
    snapshot.set(TelemetryReading(TelemetryKind::ColorTemperature, 2000.0));

    const EnhancementParameters p = interp.interpolate(balanced_baseline(), snapshot);
    REQUIRE(p.exposure == 1.2);
    REQUIRE(p.white_balance.is_identity());
}

TEST_CASE("Non-finite readings are ignored", "[interpolator][degrade]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());
    const EnhancementParameters base = balanced_baseline();

    TelemetrySnapshot snapshot;
    snapshot.set(TelemetryReading(TelemetryKind::AmbientLight, std::numeric_limits<double>::quiet_NaN()));
    snapshot.set(TelemetryReading(TelemetryKind::Motion, 0.0));

    const EnhancementParameters p = interp.interpolate(base, snapshot);
    REQUIRE(p.exposure == base.exposure);
    REQUIRE(p.sharpen_strength == 0.8);
}

TEST_CASE("Interpolated output is clamped to sane ranges", "[interpolator][clamp]") {
    TelemetryMappingTable table;
    Breakpoint wild;
    wild.at = 0.0;
    wild.effect.set(EffectField::Exposure, 12.0);
    wild.effect.set(EffectField::Sharpening, -3.0);
    wild.effect.set(EffectField::DenoiseStrength, 500.0);
    table.breakpoints = {wild};

    TelemetryMappings mappings;
    mappings.set_table(TelemetryKind::AmbientLight, table);
    ParameterInterpolator interp(mappings);

    const EnhancementParameters p = interp.interpolate(balanced_baseline(), snapshot_of(TelemetryKind::AmbientLight, 1.0));
    REQUIRE(p.exposure == EnhancementParameters::kMaxGain);
    REQUIRE(p.sharpen_strength == 0.0);
    REQUIRE(p.denoise_strength == EnhancementParameters::kMaxDenoiseStrength);
}

TEST_CASE("Interpolation does not modify the snapshot", "[interpolator]") {
    ParameterInterpolator interp(TelemetryMappings::builtin());

    TelemetrySnapshot snapshot;
    snapshot.set(TelemetryReading(TelemetryKind::AmbientLight, 750.0, "lux", 99));
    const TelemetrySnapshot copy = snapshot;

    interp.interpolate(balanced_baseline(), snapshot);
    REQUIRE(snapshot.size() == copy.size());
    REQUIRE(snapshot.get_value(TelemetryKind::AmbientLight, 0.0) == 750.0);
    REQUIRE(snapshot.readings().at(TelemetryKind::AmbientLight).captured_at == 99);
}

TEST_CASE("effect_for reports missing tables", "[interpolator]") {
    TelemetryMappings empty;
    ParameterInterpolator interp(empty);

    ParameterEffect effect;
    REQUIRE_FALSE(interp.effect_for(TelemetryKind::Motion, 0.5, effect));

    TelemetryMappings with_empty_table;
    with_empty_table.set_table(TelemetryKind::Motion, TelemetryMappingTable());
    ParameterInterpolator interp2(with_empty_table);
    REQUIRE_FALSE(interp2.effect_for(TelemetryKind::Motion, 0.5, effect));
}
