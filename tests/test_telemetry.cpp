#include <catch2/catch.hpp>
#include <yaml-cpp/yaml.h>
#include "telemetry.hpp"

using namespace hdrtel;

TEST_CASE("Telemetry kind names round-trip", "[telemetry]") {
    for (TelemetryKind kind : {TelemetryKind::AmbientLight, TelemetryKind::ColorTemperature, TelemetryKind::Motion}) {
        TelemetryKind parsed;
        REQUIRE(parse_telemetry_kind(telemetry_kind_name(kind), parsed));
        REQUIRE(parsed == kind);
    }

    TelemetryKind unused;
    REQUIRE_FALSE(parse_telemetry_kind("humidity", unused));
}

TEST_CASE("Snapshot holds at most one reading per kind", "[telemetry][snapshot]") {
    TelemetrySnapshot snapshot;
    REQUIRE(snapshot.empty());

    snapshot.set(TelemetryReading(TelemetryKind::AmbientLight, 120.0, "lux", 1));
    snapshot.set(TelemetryReading(TelemetryKind::AmbientLight, 800.0, "lux", 2));
    snapshot.set(TelemetryReading(TelemetryKind::Motion, 0.4, "normalized", 2));

    REQUIRE(snapshot.size() == 2);
    REQUIRE(snapshot.get_value(TelemetryKind::AmbientLight, 0.0) == 800.0);
    REQUIRE(snapshot.readings().at(TelemetryKind::AmbientLight).captured_at == 2);
    REQUIRE(snapshot.has(TelemetryKind::Motion));
    REQUIRE_FALSE(snapshot.has(TelemetryKind::ColorTemperature));
}

TEST_CASE("Snapshot accessors fall back to the default", "[telemetry][snapshot]") {
    TelemetrySnapshot snapshot;
    snapshot.set(TelemetryReading(TelemetryKind::ColorTemperature, 5600.0));

    REQUIRE(snapshot.get_value(TelemetryKind::Motion, 0.25) == 0.25);

    const std::map<TelemetryKind, double> values = snapshot.values();
    REQUIRE(values.size() == 1);
    REQUIRE(values.at(TelemetryKind::ColorTemperature) == 5600.0);
}

TEST_CASE("Timeline holds the latest sample of each kind", "[telemetry][timeline]") {
    const YAML::Node node = YAML::Load(
        "samples:\n"
        "  - { frame: 0, ambient_light: 50, motion_level: 0.1 }\n"
        "  - { frame: 30, color_temperature: 3200 }\n"
        "  - { frame: 90, ambient_light: 2000 }\n");

    TelemetryTimeline timeline;
    REQUIRE(timeline.load_from_node(node));
    REQUIRE(timeline.samples().size() == 3);

    const TelemetrySnapshot first = timeline.snapshot_at(0);
    REQUIRE(first.size() == 2);
    REQUIRE(first.get_value(TelemetryKind::AmbientLight, 0.0) == 50.0);

    const TelemetrySnapshot middle = timeline.snapshot_at(45, 1500000);
    REQUIRE(middle.size() == 3);
    REQUIRE(middle.get_value(TelemetryKind::AmbientLight, 0.0) == 50.0);
    REQUIRE(middle.get_value(TelemetryKind::ColorTemperature, 0.0) == 3200.0);
    REQUIRE(middle.readings().at(TelemetryKind::ColorTemperature).unit == "kelvin");
    REQUIRE(middle.readings().at(TelemetryKind::ColorTemperature).captured_at == 1500000);

    const TelemetrySnapshot late = timeline.snapshot_at(500);
    REQUIRE(late.get_value(TelemetryKind::AmbientLight, 0.0) == 2000.0);
    REQUIRE(late.get_value(TelemetryKind::Motion, 0.0) == 0.1);
}

TEST_CASE("Timeline before the first sample is empty", "[telemetry][timeline]") {
    TelemetryTimeline timeline;
    TelemetryTimeline::Sample sample;
    sample.frame = 10;
    sample.values[TelemetryKind::Motion] = 0.7;
    timeline.add_sample(sample);

    REQUIRE(timeline.snapshot_at(9).empty());
    REQUIRE(timeline.snapshot_at(10).get_value(TelemetryKind::Motion, 0.0) == 0.7);
}

TEST_CASE("Timeline samples are kept in frame order", "[telemetry][timeline]") {
    TelemetryTimeline timeline;
    TelemetryTimeline::Sample late;
    late.frame = 50;
    late.values[TelemetryKind::AmbientLight] = 900.0;
    TelemetryTimeline::Sample early;
    early.frame = 5;
    early.values[TelemetryKind::AmbientLight] = 100.0;

    timeline.add_sample(late);
    timeline.add_sample(early);

    REQUIRE(timeline.samples().front().frame == 5);
    REQUIRE(timeline.snapshot_at(20).get_value(TelemetryKind::AmbientLight, 0.0) == 100.0);
}

TEST_CASE("Malformed timelines are rejected", "[telemetry][timeline]") {
    TelemetryTimeline timeline;

    REQUIRE_FALSE(timeline.load_from_node(YAML::Load("readings: []")));
    REQUIRE_FALSE(timeline.load_from_node(YAML::Load("samples:\n  - { ambient_light: 10 }\n")));
    REQUIRE_FALSE(timeline.load_from_node(YAML::Load("samples:\n  - { frame: 0, humidity: 40 }\n")));
    REQUIRE_FALSE(timeline.load_from_yaml("does/not/exist.yaml"));
}

TEST_CASE("Non-numeric sample values fail the load without throwing", "[telemetry][timeline]") {
    TelemetryTimeline timeline;
    REQUIRE(timeline.load_from_node(YAML::Load("samples:\n  - { frame: 0, ambient_light: 40 }\n")));

    bool loaded = true;
    REQUIRE_NOTHROW(loaded = timeline.load_from_node(YAML::Load("samples: [{frame: 0, ambient_light: dark}]")));
    REQUIRE_FALSE(loaded);
    REQUIRE_NOTHROW(loaded = timeline.load_from_node(YAML::Load("samples: [{frame: first, motion_level: 0.2}]")));
    REQUIRE_FALSE(loaded);

    // The earlier timeline is kept
    REQUIRE(timeline.samples().size() == 1);
    REQUIRE(timeline.snapshot_at(0).get_value(TelemetryKind::AmbientLight, 0.0) == 40.0);
}

TEST_CASE("Simulated telemetry is deterministic per seed", "[telemetry][simulation]") {
    SimulatedTelemetry a(7);
    SimulatedTelemetry b(7);

    for (int i = 0; i < 50; ++i) {
        const double t = i * 0.5;
        const TelemetrySnapshot sa = a.sample(t);
        const TelemetrySnapshot sb = b.sample(t);
        REQUIRE(sa.values() == sb.values());
    }
}

TEST_CASE("Simulated telemetry stays within sensor ranges", "[telemetry][simulation]") {
    SimulatedTelemetry sim(42, 60.0);

    for (int i = 0; i < 600; ++i) {
        const TelemetrySnapshot s = sim.sample(i * 0.25);
        REQUIRE(s.size() == 3);

        const double lux = s.get_value(TelemetryKind::AmbientLight, -1.0);
        const double kelvin = s.get_value(TelemetryKind::ColorTemperature, -1.0);
        const double motion = s.get_value(TelemetryKind::Motion, -1.0);

        REQUIRE(lux >= 50.0);
        REQUIRE(lux <= 5000.0);
        REQUIRE(kelvin >= 2700.0);
        REQUIRE(kelvin <= 6500.0);
        REQUIRE(motion >= 0.0);
        REQUIRE(motion <= 1.0);
    }
}

TEST_CASE("Simulated day is brighter at noon than at night", "[telemetry][simulation]") {
    SimulatedTelemetry sim(3, 100.0);

    const double dawn = sim.sample(1.0).get_value(TelemetryKind::AmbientLight, 0.0);
    const double noon = sim.sample(50.0).get_value(TelemetryKind::AmbientLight, 0.0);
    const double night = sim.sample(99.0).get_value(TelemetryKind::AmbientLight, 0.0);

    REQUIRE(noon > dawn);
    REQUIRE(noon > night);
}
