/**
 * @file telemetry.cpp
 * @brief Telemetry snapshots and the scripted/simulated sources that feed them
 */

#include "telemetry.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace hdrtel {

const char* telemetry_kind_name(TelemetryKind kind)
{
    switch (kind) {
    case TelemetryKind::AmbientLight:
        return "ambient_light";
    case TelemetryKind::ColorTemperature:
        return "color_temperature";
    case TelemetryKind::Motion:
        return "motion_level";
    }
    return "unknown";
}

bool parse_telemetry_kind(const std::string& name, TelemetryKind& kind)
{
    if (name == "ambient_light") {
        kind = TelemetryKind::AmbientLight;
        return true;
    }
    if (name == "color_temperature") {
        kind = TelemetryKind::ColorTemperature;
        return true;
    }
    if (name == "motion_level") {
        kind = TelemetryKind::Motion;
        return true;
    }
    return false;
}

// ============================================================================
// TelemetrySnapshot
// ============================================================================

void TelemetrySnapshot::set(const TelemetryReading& reading)
{
    auto it = readings_.find(reading.kind);
    if (it != readings_.end()) {
        readings_.erase(it);
    }
    readings_.emplace(reading.kind, reading);
}

double TelemetrySnapshot::get_value(TelemetryKind kind, double default_value) const
{
    auto it = readings_.find(kind);
    if (it == readings_.end()) {
        return default_value;
    }
    return it->second.value;
}

std::map<TelemetryKind, double> TelemetrySnapshot::values() const
{
    std::map<TelemetryKind, double> out;
    for (const auto& entry : readings_) {
        out[entry.first] = entry.second.value;
    }
    return out;
}

// ============================================================================
// TelemetryTimeline
// ============================================================================

namespace {

const char* unit_for(TelemetryKind kind)
{
    switch (kind) {
    case TelemetryKind::AmbientLight:
        return "lux";
    case TelemetryKind::ColorTemperature:
        return "kelvin";
    case TelemetryKind::Motion:
        return "normalized";
    }
    return "";
}

} // anonymous namespace

bool TelemetryTimeline::load_from_yaml(const std::string& yaml_path)
{
    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        return load_from_node(root);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "Telemetry YAML parsing error: " << e.what() << std::endl;
        return false;
    }
}

bool TelemetryTimeline::load_from_node(const YAML::Node& node)
{
    try {
        const YAML::Node list = node["samples"];
        if (!list || !list.IsSequence()) {
            std::cerr << "Telemetry file must contain a 'samples' sequence" << std::endl;
            return false;
        }

        std::vector<Sample> loaded;
        for (const auto& entry : list) {
            if (!entry.IsMap() || !entry["frame"]) {
                std::cerr << "Telemetry sample must be a map with a 'frame' key" << std::endl;
                return false;
            }

            Sample sample;
            sample.frame = entry["frame"].as<uint32_t>();

            for (const auto& kv : entry) {
                const std::string key = kv.first.as<std::string>();
                if (key == "frame") {
                    continue;
                }
                TelemetryKind kind;
                if (!parse_telemetry_kind(key, kind)) {
                    std::cerr << "Unknown telemetry kind in sample at frame "
                              << sample.frame << ": " << key << std::endl;
                    return false;
                }
                sample.values[kind] = kv.second.as<double>();
            }
            loaded.push_back(sample);
        }

        samples_.clear();
        for (const auto& s : loaded) {
            add_sample(s);
        }
        return true;
    }
    catch (const YAML::Exception& e) {
        std::cerr << "Telemetry sample error: " << e.what() << std::endl;
        return false;
    }
}

void TelemetryTimeline::add_sample(const Sample& sample)
{
    // Keep sorted; a later sample at the same frame wins
    auto pos = std::upper_bound(samples_.begin(), samples_.end(), sample.frame,
        [](uint32_t frame, const Sample& s) { return frame < s.frame; });
    samples_.insert(pos, sample);
}

TelemetrySnapshot TelemetryTimeline::snapshot_at(uint32_t frame_index, uint64_t timestamp) const
{
    std::map<TelemetryKind, double> held;
    for (const auto& sample : samples_) {
        if (sample.frame > frame_index) {
            break;
        }
        for (const auto& kv : sample.values) {
            held[kv.first] = kv.second;
        }
    }

    TelemetrySnapshot snapshot;
    for (const auto& kv : held) {
        snapshot.set(TelemetryReading(kv.first, kv.second, unit_for(kv.first), timestamp));
    }
    return snapshot;
}

// ============================================================================
// SimulatedTelemetry
// ============================================================================

SimulatedTelemetry::SimulatedTelemetry(uint32_t seed, double cycle_seconds)
    : rng_(seed)
    , cycle_seconds_(cycle_seconds > 0.0 ? cycle_seconds : 120.0)
    , motion_level_(0.3)
    , target_motion_(0.3)
    , last_target_change_(0.0)
    , next_target_change_(0.0)
{
    std::uniform_real_distribution<double> interval(10.0, 20.0);
    next_target_change_ = interval(rng_);
}

TelemetrySnapshot SimulatedTelemetry::sample(double stream_seconds)
{
    const double cycle_position =
        std::fmod(stream_seconds, cycle_seconds_) / cycle_seconds_;
    const uint64_t captured_at = static_cast<uint64_t>(stream_seconds * 1e6);

    TelemetrySnapshot snapshot;
    snapshot.set(TelemetryReading(TelemetryKind::AmbientLight,
        ambient_light(cycle_position), "lux", captured_at));
    snapshot.set(TelemetryReading(TelemetryKind::ColorTemperature,
        color_temperature(cycle_position), "kelvin", captured_at));
    snapshot.set(TelemetryReading(TelemetryKind::Motion,
        motion(stream_seconds), "normalized", captured_at));
    return snapshot;
}

double SimulatedTelemetry::ambient_light(double cycle_position)
{
    double lux;
    if (cycle_position < 0.25) {
        lux = 100.0 + 900.0 * (cycle_position * 4.0);            // dawn
    }
    else if (cycle_position < 0.5) {
        lux = 1000.0 + 4000.0 * ((cycle_position - 0.25) * 4.0); // morning to noon
    }
    else if (cycle_position < 0.75) {
        lux = 5000.0 - 4000.0 * ((cycle_position - 0.5) * 4.0);  // afternoon to dusk
    }
    else {
        lux = 1000.0 - 900.0 * ((cycle_position - 0.75) * 4.0);  // night
    }

    std::uniform_real_distribution<double> noise(-50.0, 50.0);
    lux += noise(rng_);
    return std::max(50.0, std::min(5000.0, lux));
}

double SimulatedTelemetry::color_temperature(double cycle_position)
{
    const double pi = 3.14159265358979323846;
    double kelvin;
    if (cycle_position < 0.3) {
        kelvin = 3000.0 + 2000.0 * (cycle_position / 0.3);
    }
    else if (cycle_position < 0.7) {
        kelvin = 5000.0 + 1000.0 * std::sin((cycle_position - 0.3) * 2.5 * pi);
    }
    else {
        kelvin = 5000.0 - 2000.0 * ((cycle_position - 0.7) / 0.3);
    }

    std::uniform_real_distribution<double> noise(-100.0, 100.0);
    kelvin += noise(rng_);
    return std::max(2700.0, std::min(6500.0, kelvin));
}

double SimulatedTelemetry::motion(double stream_seconds)
{
    static const double kLevels[] = {0.1, 0.3, 0.5, 0.7, 0.9};

    if (stream_seconds - last_target_change_ > next_target_change_) {
        std::uniform_int_distribution<int> pick(0, 4);
        std::uniform_real_distribution<double> interval(10.0, 20.0);
        target_motion_ = kLevels[pick(rng_)];
        last_target_change_ = stream_seconds;
        next_target_change_ = interval(rng_);
    }

    // Smooth transition to target
    motion_level_ += (target_motion_ - motion_level_) * 0.1;

    std::uniform_real_distribution<double> noise(-0.05, 0.05);
    const double value = motion_level_ + noise(rng_);
    return std::max(0.0, std::min(1.0, value));
}

} // namespace hdrtel
