#include <catch2/catch.hpp>
#include <algorithm>
#include <string>
#include "stats.hpp"

using namespace hdrtel;

namespace {

size_t count_fields(const std::string& row)
{
    return static_cast<size_t>(std::count(row.begin(), row.end(), ',')) + 1;
}

} // anonymous namespace

TEST_CASE("Average is zero before any frame", "[metrics][accumulator]") {
    MetricsAccumulator acc;
    REQUIRE(acc.frame_count() == 0);
    REQUIRE(acc.average() == 0.0);
}

TEST_CASE("Average of one frame is that frame's time", "[metrics][accumulator]") {
    MetricsAccumulator acc;
    acc.record(12.5);
    REQUIRE(acc.frame_count() == 1);
    REQUIRE(acc.average() == 12.5);
}

TEST_CASE("Average of many frames is sum / count", "[metrics][accumulator]") {
    MetricsAccumulator acc;
    double sum = 0.0;
    for (int i = 0; i < 100; ++i) {
        const double ms = 0.25 * i + 3.0;
        acc.record(ms);
        sum += ms;
    }
    REQUIRE(acc.frame_count() == 100);
    REQUIRE(acc.total_time_ms() == sum);
    REQUIRE(acc.average() == sum / 100.0);
}

TEST_CASE("Reset clears the totals", "[metrics][accumulator]") {
    MetricsAccumulator acc;
    acc.record(4.0);
    acc.record(6.0);
    acc.reset();
    REQUIRE(acc.frame_count() == 0);
    REQUIRE(acc.total_time_ms() == 0.0);
    REQUIRE(acc.average() == 0.0);
}

TEST_CASE("Metrics readout carries timing and headline parameters", "[metrics]") {
    ProcessingMetrics m;
    m.process_time_ms = 8.0;
    m.average_time_ms = 7.5;
    m.parameters.exposure = 1.3;
    m.parameters.contrast = 1.05;
    m.parameters.saturation = 1.1;
    m.parameters.sharpen_strength = 0.4;

    const std::map<std::string, double> readout = m.to_map();
    REQUIRE(readout.size() == 6);
    REQUIRE(readout.at("process_time_ms") == 8.0);
    REQUIRE(readout.at("avg_time_ms") == 7.5);
    REQUIRE(readout.at("exposure") == 1.3);
    REQUIRE(readout.at("contrast") == 1.05);
    REQUIRE(readout.at("saturation") == 1.1);
    REQUIRE(readout.at("sharpening") == 0.4);
}

TEST_CASE("CSV rows line up with the header", "[metrics][csv]") {
    ProcessingMetrics m;
    m.frame_index = 42;
    m.parameters.tone_curve = ToneCurve::Adaptive;

    const std::string row = m.to_csv();
    REQUIRE(count_fields(row) == count_fields(ProcessingMetrics::csv_header()));
    REQUIRE(row.compare(0, 3, "42,") == 0);
    REQUIRE(row.find("adaptive") != std::string::npos);
}

TEST_CASE("Session statistics track min, max and throughput", "[metrics][session]") {
    SessionStats stats;
    stats.preset = "balanced";

    ProcessingMetrics m;
    for (double ms : {10.0, 20.0, 30.0}) {
        m.process_time_ms = ms;
        stats.add_frame(m, ms != 20.0);
    }
    stats.finalize();

    REQUIRE(stats.total_frames == 3);
    REQUIRE(stats.telemetry_frames == 2);
    REQUIRE(stats.min_time_ms == 10.0);
    REQUIRE(stats.max_time_ms == 30.0);
    REQUIRE(stats.avg_time_ms == Approx(20.0));
    REQUIRE(stats.throughput_fps == Approx(50.0));

    const std::string json = stats.to_json();
    REQUIRE(json.find("\"preset\": \"balanced\"") != std::string::npos);
    REQUIRE(json.find("\"total_frames\": 3") != std::string::npos);
    REQUIRE(json.find("\"telemetry_frames\": 2") != std::string::npos);
}

TEST_CASE("Empty session finalizes to zeros", "[metrics][session]") {
    SessionStats stats;
    stats.finalize();
    REQUIRE(stats.avg_time_ms == 0.0);
    REQUIRE(stats.throughput_fps == 0.0);
}

TEST_CASE("Session JSON escapes the preset id", "[metrics][session]") {
    SessionStats stats;
    stats.preset = "night \"v2\"\\wide\n";
    stats.finalize();

    const std::string json = stats.to_json();
    REQUIRE(json.find("\"preset\": \"night \\\"v2\\\"\\\\wide\\n\",") != std::string::npos);

    // Exactly one raw newline per line of the document, none inside the value
    REQUIRE(std::count(json.begin(), json.end(), '\n') == 9);
}
