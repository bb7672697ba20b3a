#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace hdrtel {

/**
 * Environmental signal kinds understood by the parameter interpolator
 */
enum class TelemetryKind {
    AmbientLight,       // lux
    ColorTemperature,   // kelvin
    Motion              // normalized 0..1
};

/**
 * Stable configuration key for a telemetry kind
 * ("ambient_light", "color_temperature", "motion_level")
 */
const char* telemetry_kind_name(TelemetryKind kind);

/**
 * Parse a telemetry kind from its configuration key
 * @return false if the name is unknown
 */
bool parse_telemetry_kind(const std::string& name, TelemetryKind& kind);

/**
 * A single reading, immutable once created
 */
struct TelemetryReading {
    TelemetryKind kind;
    double value;
    std::string unit;
    uint64_t captured_at;   // microseconds

    TelemetryReading(TelemetryKind k, double v, const std::string& u = "", uint64_t ts = 0)
        : kind(k), value(v), unit(u), captured_at(ts) {}
};

/**
 * Latest reading of each kind for one sampling instant.
 * At most one reading per kind; setting a kind again replaces it.
 */
class TelemetrySnapshot {
public:
    TelemetrySnapshot() = default;

    void set(const TelemetryReading& reading);

    bool has(TelemetryKind kind) const { return readings_.count(kind) != 0; }

    double get_value(TelemetryKind kind, double default_value) const;

    // Bulk kind -> value view
    std::map<TelemetryKind, double> values() const;

    const std::map<TelemetryKind, TelemetryReading>& readings() const { return readings_; }

    bool empty() const { return readings_.empty(); }
    size_t size() const { return readings_.size(); }

private:
    std::map<TelemetryKind, TelemetryReading> readings_;
};

/**
 * Scripted telemetry keyed by frame index.
 *
 * Samples are held: the snapshot for frame N carries, for every kind,
 * the most recent sample at or before N.
 */
class TelemetryTimeline {
public:
    struct Sample {
        uint32_t frame;
        std::map<TelemetryKind, double> values;
    };

    /**
     * @brief Load samples from a YAML file
     *
     * Expected layout:
     *   samples:
     *     - { frame: 0, ambient_light: 50, motion_level: 0.1 }
     *     - { frame: 90, ambient_light: 2000 }
     */
    bool load_from_yaml(const std::string& yaml_path);

    bool load_from_node(const YAML::Node& node);

    void add_sample(const Sample& sample);

    TelemetrySnapshot snapshot_at(uint32_t frame_index, uint64_t timestamp = 0) const;

    const std::vector<Sample>& samples() const { return samples_; }

private:
    std::vector<Sample> samples_;   // sorted by frame
};

/**
 * Deterministic day/night sensor simulation driven by stream time.
 * Same seed, same sequence.
 */
class SimulatedTelemetry {
public:
    explicit SimulatedTelemetry(uint32_t seed = 42, double cycle_seconds = 120.0);

    /**
     * Produce the snapshot for a point in stream time.
     * Calls must be made with non-decreasing time for the motion walk.
     */
    TelemetrySnapshot sample(double stream_seconds);

private:
    double ambient_light(double cycle_position);
    double color_temperature(double cycle_position);
    double motion(double stream_seconds);

    std::mt19937 rng_;
    double cycle_seconds_;

    double motion_level_;
    double target_motion_;
    double last_target_change_;
    double next_target_change_;
};

} // namespace hdrtel
