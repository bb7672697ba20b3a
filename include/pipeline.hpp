#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <png.h>
#include "config.hpp"
#include "frame.hpp"
#include "processor.hpp"
#include "stats.hpp"
#include "telemetry.hpp"

namespace hdrtel {

/**
 * @brief Batch enhancement pipeline orchestrator
 *
 * Manages the complete enhancement workflow:
 * - Load PNG frames from the input directory
 * - Pick the telemetry snapshot for each frame (timeline or simulation)
 * - Run the HDR processor
 * - Write enhanced PNG frames and performance statistics
 */
class EnhancementPipeline {
public:
    /**
     * @brief Construct pipeline with configuration
     * @param config Enhancement configuration
     */
    explicit EnhancementPipeline(const EngineConfig& config);

    /**
     * @brief Run enhancement on all frames in input directory
     * @param stop_flag Optional flag checked between frames
     * @return true if successful, false otherwise
     */
    bool run(const std::atomic<bool>* stop_flag = nullptr);

    /**
     * @brief Print run summary statistics
     */
    void print_summary() const;

    /**
     * @brief Write statistics to JSON file
     * @param output_path Path to output JSON file
     */
    void write_statistics(const std::string& output_path) const;

    const SessionStats& session_stats() const { return session_; }

    /**
     * @brief Load an 8-bit PNG as a BGR frame
     *
     * Palette and gray images are expanded, 16-bit samples stripped to 8
     * and alpha dropped.
     *
     * @param png_path Path to PNG file
     * @param frame Output frame structure
     * @return true if successful, false otherwise
     */
    static bool load_frame_from_png(const std::string& png_path, Frame& frame);

    /**
     * @brief Write a BGR frame as an 8-bit RGB PNG
     * @param frame Frame to write
     * @param png_path Output path
     * @return true if successful, false otherwise
     */
    static bool write_frame_to_png(const Frame& frame, const std::string& png_path);

private:
    bool prepare_telemetry();
    bool snapshot_for(const Frame& frame, TelemetrySnapshot& snapshot);

    EngineConfig config_;
    std::unique_ptr<HdrProcessor> processor_;
    TelemetryTimeline timeline_;
    std::unique_ptr<SimulatedTelemetry> simulation_;
    SessionStats session_;
    std::vector<ProcessingMetrics> frame_metrics_;
};

} // namespace hdrtel
