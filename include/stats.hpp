#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "parameters.hpp"

namespace hdrtel {

/**
 * Running per-frame latency totals owned by one processor.
 * Single writer; not thread-safe.
 */
class MetricsAccumulator {
public:
    MetricsAccumulator();

    // Add one frame's processing time
    void record(double duration_ms);

    // totalTimeMs / frameCount, 0 before the first frame
    double average() const;

    void reset();

    uint64_t frame_count() const { return frame_count_; }
    double total_time_ms() const { return total_time_ms_; }

private:
    uint64_t frame_count_;
    double total_time_ms_;
};

/**
 * Result metrics returned with each processed frame
 */
struct ProcessingMetrics {
    uint32_t frame_index;
    double process_time_ms;
    double average_time_ms;
    uint64_t frame_count;
    EnhancementParameters parameters;   // values actually used

    ProcessingMetrics()
        : frame_index(0), process_time_ms(0.0), average_time_ms(0.0), frame_count(0) {}

    /**
     * Flat readout for observability displays:
     * process_time_ms, avg_time_ms, exposure, contrast, saturation, sharpening
     */
    std::map<std::string, double> to_map() const;

    // Format as CSV row
    std::string to_csv() const;

    // CSV header
    static std::string csv_header();
};

/**
 * Aggregate statistics for a batch run
 */
struct SessionStats {
    std::string preset;
    uint32_t total_frames;
    uint32_t telemetry_frames;   // frames that carried a snapshot

    double total_time_ms;
    double min_time_ms;
    double max_time_ms;
    double avg_time_ms;
    double throughput_fps;

    SessionStats()
        : total_frames(0), telemetry_frames(0),
          total_time_ms(0), min_time_ms(0), max_time_ms(0),
          avg_time_ms(0), throughput_fps(0) {}

    // Add frame metrics
    void add_frame(const ProcessingMetrics& metrics, bool had_telemetry);

    // Compute final averages
    void finalize();

    // Export to JSON string
    std::string to_json() const;
};

} // namespace hdrtel
