/**
 * @file pipeline.cpp
 * @brief Batch enhancement pipeline orchestration
 *
 * Manages the complete enhancement workflow:
 * - Load PNG frames from input directory
 * - Select telemetry for each frame
 * - Run the HDR processor
 * - Track statistics and performance metrics
 * - Write enhanced output
 */

#include "pipeline.hpp"
#include <iostream>
#include <fstream>
#include <algorithm>
#include <iomanip>
#include <cstdio>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace hdrtel {

namespace {

bool ensure_directory(const std::string& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    return mkdir(path.c_str(), 0755) == 0;
}

std::string base_name(const std::string& path)
{
    const size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // anonymous namespace

EnhancementPipeline::EnhancementPipeline(const EngineConfig& config)
    : config_(config)
{
    session_.preset = config_.preset;
}

bool EnhancementPipeline::load_frame_from_png(const std::string& png_path, Frame& frame)
{
    FILE* fp = fopen(png_path.c_str(), "rb");
    if (!fp) {
        std::cerr << "Failed to open PNG: " << png_path << std::endl;
        return false;
    }

    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        fclose(fp);
        return false;
    }

    if (setjmp(png_jmpbuf(png))) {
        std::cerr << "libpng error while reading: " << png_path << std::endl;
        png_destroy_read_struct(&png, &info, nullptr);
        fclose(fp);
        return false;
    }

    png_init_io(png, fp);
    png_read_info(png, info);

    const uint32_t width = png_get_image_width(png, info);
    const uint32_t height = png_get_image_height(png, info);
    const int bit_depth = png_get_bit_depth(png, info);
    const int color_type = png_get_color_type(png, info);

    // Normalize everything to 8-bit BGR
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }
    if (bit_depth == 16) {
        png_set_strip_16(png);
    }
    if (color_type & PNG_COLOR_MASK_ALPHA) {
        png_set_strip_alpha(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png);
    }
    png_set_bgr(png);
    png_read_update_info(png, info);

    if (png_get_channels(png, info) != 3 || png_get_rowbytes(png, info) != static_cast<size_t>(width) * 3) {
        std::cerr << "PNG could not be converted to 8-bit BGR: " << png_path << std::endl;
        png_destroy_read_struct(&png, &info, nullptr);
        fclose(fp);
        return false;
    }

    frame.width = width;
    frame.height = height;
    frame.channels = 3;
    frame.data.resize(frame.byte_count());

    // Allocate row pointers
    std::vector<png_bytep> row_pointers(height);
    for (uint32_t y = 0; y < height; ++y) {
        row_pointers[y] = reinterpret_cast<png_bytep>(&frame.data[static_cast<size_t>(y) * width * 3]);
    }

    png_read_image(png, row_pointers.data());
    png_read_end(png, nullptr);

    png_destroy_read_struct(&png, &info, nullptr);
    fclose(fp);

    return true;
}

bool EnhancementPipeline::write_frame_to_png(const Frame& frame, const std::string& png_path)
{
    if (!frame.is_valid() || frame.channels != 3) {
        std::cerr << "Refusing to write malformed frame: " << png_path << std::endl;
        return false;
    }

    FILE* fp = fopen(png_path.c_str(), "wb");
    if (!fp) {
        std::cerr << "Failed to open output PNG: " << png_path << std::endl;
        return false;
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        fclose(fp);
        return false;
    }

    std::vector<png_bytep> row_pointers(frame.height);
    for (uint32_t y = 0; y < frame.height; ++y) {
        row_pointers[y] = const_cast<png_bytep>(&frame.data[static_cast<size_t>(y) * frame.width * 3]);
    }

    if (setjmp(png_jmpbuf(png))) {
        std::cerr << "libpng error while writing: " << png_path << std::endl;
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        return false;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, frame.width, frame.height, 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_set_bgr(png);

    png_write_image(png, row_pointers.data());
    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);
    fclose(fp);

    return true;
}

bool EnhancementPipeline::prepare_telemetry()
{
    if (!config_.telemetry_file.empty()) {
        if (config_.simulate_telemetry) {
            std::cerr << "Warning: telemetry file given, ignoring simulated telemetry" << std::endl;
        }
        if (!timeline_.load_from_yaml(config_.telemetry_file)) {
            std::cerr << "Failed to load telemetry timeline: " << config_.telemetry_file << std::endl;
            return false;
        }
        std::cout << "Telemetry timeline: " << timeline_.samples().size() << " samples" << std::endl;
    }
    else if (config_.simulate_telemetry) {
        simulation_.reset(new SimulatedTelemetry(config_.simulation_seed));
        std::cout << "Telemetry: simulated day/night cycle" << std::endl;
    }
    return true;
}

bool EnhancementPipeline::snapshot_for(const Frame& frame, TelemetrySnapshot& snapshot)
{
    if (!config_.telemetry_file.empty()) {
        snapshot = timeline_.snapshot_at(frame.frame_index, frame.timestamp);
    }
    else if (simulation_) {
        snapshot = simulation_->sample(frame.frame_index / config_.frame_rate);
    }
    return !snapshot.empty();
}

bool EnhancementPipeline::run(const std::atomic<bool>* stop_flag)
{
    std::cout << "=== HDR Telemetry Enhancement ===" << std::endl;
    std::cout << "Input: " << config_.input_dir << std::endl;
    std::cout << "Output: " << config_.output_dir << std::endl;
    std::cout << "Preset: " << config_.preset << std::endl;
    std::cout << std::endl;

    // Scan input directory for PNG files (C++14 compatible)
    std::vector<std::string> input_files;
    DIR* dir = opendir(config_.input_dir.c_str());
    if (!dir) {
        std::cerr << "Failed to open input directory: " << config_.input_dir << std::endl;
        return false;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string filename = entry->d_name;
        if (filename.length() > 4 && filename.substr(filename.length() - 4) == ".png") {
            input_files.push_back(config_.input_dir + "/" + filename);
        }
    }
    closedir(dir);

    if (input_files.empty()) {
        std::cerr << "No PNG files found in input directory" << std::endl;
        return false;
    }

    // Sort files by name
    std::sort(input_files.begin(), input_files.end());

    std::cout << "Found " << input_files.size() << " PNG files" << std::endl;

    if (!ensure_directory(config_.output_dir)) {
        std::cerr << "Failed to create output directory: " << config_.output_dir << std::endl;
        return false;
    }

    if (!prepare_telemetry()) {
        return false;
    }

    // Shared tables, built once for the run
    std::shared_ptr<const LookupTableBank> luts = LookupTableBank::build_shared(config_.highlight_knee);
    processor_.reset(new HdrProcessor(config_.preset, config_.presets, config_.mappings, luts));

    if (!processor_->preset_found()) {
        std::cerr << "Warning: unknown preset '" << config_.preset
                  << "', using default parameters" << std::endl;
    }

    for (size_t i = 0; i < input_files.size(); ++i) {
        if (stop_flag && stop_flag->load()) {
            std::cout << "Stopping after " << i << " frames" << std::endl;
            break;
        }

        const std::string& input_path = input_files[i];

        Frame frame;
        frame.frame_index = static_cast<uint32_t>(i);
        frame.timestamp = static_cast<uint64_t>(i / config_.frame_rate * 1e6);

        if (!load_frame_from_png(input_path, frame)) {
            std::cerr << "Failed to load frame " << i << std::endl;
            return false;
        }

        TelemetrySnapshot snapshot;
        const bool has_telemetry = snapshot_for(frame, snapshot);

        Frame enhanced;
        ProcessingMetrics metrics;
        processor_->process(frame, has_telemetry ? &snapshot : nullptr, enhanced, metrics);

        const std::string output_path = config_.output_dir + "/" + base_name(input_path);
        if (!write_frame_to_png(enhanced, output_path)) {
            return false;
        }

        session_.add_frame(metrics, has_telemetry);
        if (config_.write_frame_csv) {
            frame_metrics_.push_back(metrics);
        }

        const EnhancementParameters& p = metrics.parameters;
        std::cout << "Frame " << std::setw(6) << i
                  << " [" << tone_curve_name(p.tone_curve) << "]"
                  << " | exp " << std::fixed << std::setprecision(2) << p.exposure
                  << " | sat " << p.saturation
                  << " | sharp " << p.sharpen_strength
                  << " | wb " << p.white_balance.red << "/" << p.white_balance.blue
                  << " | " << metrics.process_time_ms << " ms"
                  << std::endl;
    }

    session_.finalize();

    // Print summary
    print_summary();

    // Write statistics to JSON
    write_statistics(config_.output_dir + "/processing_stats.json");

    if (config_.write_frame_csv) {
        const std::string csv_path = config_.output_dir + "/frame_metrics.csv";
        std::ofstream csv(csv_path);
        if (!csv) {
            std::cerr << "Failed to write frame metrics to " << csv_path << std::endl;
            return false;
        }
        csv << ProcessingMetrics::csv_header() << "\n";
        for (const auto& m : frame_metrics_) {
            csv << m.to_csv() << "\n";
        }
        std::cout << "Frame metrics written to " << csv_path << std::endl;
    }

    return true;
}

void EnhancementPipeline::print_summary() const
{
    std::cout << std::endl;
    std::cout << "=== Enhancement Summary ===" << std::endl;
    std::cout << "Frames processed: " << session_.total_frames << std::endl;
    std::cout << "Frames with telemetry: " << session_.telemetry_frames << std::endl;
    std::cout << "Average process time: " << std::fixed << std::setprecision(2)
              << session_.avg_time_ms << " ms/frame"
              << " (min " << session_.min_time_ms << ", max " << session_.max_time_ms << ")" << std::endl;
    std::cout << "Throughput: " << std::fixed << std::setprecision(1)
              << session_.throughput_fps << " fps" << std::endl;
}

void EnhancementPipeline::write_statistics(const std::string& output_path) const
{
    std::ofstream ofs(output_path);
    if (!ofs) {
        std::cerr << "Failed to write statistics to " << output_path << std::endl;
        return;
    }

    ofs << session_.to_json() << "\n";

    std::cout << "Statistics written to " << output_path << std::endl;
}

} // namespace hdrtel
