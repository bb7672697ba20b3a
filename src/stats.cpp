#include "stats.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace hdrtel {

namespace {

std::string json_escape(const std::string& text)
{
    std::ostringstream oss;
    for (char c : text) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c))
                    << std::dec << std::setfill(' ');
            }
            else {
                oss << c;
            }
        }
    }
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// MetricsAccumulator
// ============================================================================

MetricsAccumulator::MetricsAccumulator()
    : frame_count_(0), total_time_ms_(0.0)
{
}

void MetricsAccumulator::record(double duration_ms)
{
    frame_count_++;
    total_time_ms_ += duration_ms;
}

double MetricsAccumulator::average() const
{
    if (frame_count_ == 0) return 0.0;
    return total_time_ms_ / static_cast<double>(frame_count_);
}

void MetricsAccumulator::reset()
{
    frame_count_ = 0;
    total_time_ms_ = 0.0;
}

// ============================================================================
// ProcessingMetrics
// ============================================================================

std::map<std::string, double> ProcessingMetrics::to_map() const
{
    std::map<std::string, double> out;
    out["process_time_ms"] = process_time_ms;
    out["avg_time_ms"] = average_time_ms;
    out["exposure"] = parameters.exposure;
    out["contrast"] = parameters.contrast;
    out["saturation"] = parameters.saturation;
    out["sharpening"] = parameters.sharpen_strength;
    return out;
}

std::string ProcessingMetrics::csv_header()
{
    return "frame_index,process_time_ms,avg_time_ms,"
           "exposure,contrast,saturation,sharpening,"
           "wb_red,wb_blue,tone_curve,denoise_strength";
}

std::string ProcessingMetrics::to_csv() const
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << frame_index << ","
        << process_time_ms << ","
        << average_time_ms << ","
        << parameters.exposure << ","
        << parameters.contrast << ","
        << parameters.saturation << ","
        << parameters.sharpen_strength << ","
        << parameters.white_balance.red << ","
        << parameters.white_balance.blue << ","
        << tone_curve_name(parameters.tone_curve) << ","
        << parameters.denoise_strength;

    return oss.str();
}

// ============================================================================
// SessionStats
// ============================================================================

void SessionStats::add_frame(const ProcessingMetrics& metrics, bool had_telemetry)
{
    if (total_frames == 0) {
        min_time_ms = metrics.process_time_ms;
        max_time_ms = metrics.process_time_ms;
    }
    else {
        min_time_ms = std::min(min_time_ms, metrics.process_time_ms);
        max_time_ms = std::max(max_time_ms, metrics.process_time_ms);
    }

    total_frames++;
    if (had_telemetry) {
        telemetry_frames++;
    }

    total_time_ms += metrics.process_time_ms;
}

void SessionStats::finalize()
{
    if (total_frames > 0) {
        avg_time_ms = total_time_ms / total_frames;
    }
    if (avg_time_ms > 0.0) {
        throughput_fps = 1000.0 / avg_time_ms;
    }
}

std::string SessionStats::to_json() const
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << "{\n";
    oss << "  \"preset\": \"" << json_escape(preset) << "\",\n";
    oss << "  \"total_frames\": " << total_frames << ",\n";
    oss << "  \"telemetry_frames\": " << telemetry_frames << ",\n";
    oss << "  \"total_time_ms\": " << total_time_ms << ",\n";
    oss << "  \"min_time_ms\": " << min_time_ms << ",\n";
    oss << "  \"max_time_ms\": " << max_time_ms << ",\n";
    oss << "  \"avg_time_ms\": " << avg_time_ms << ",\n";
    oss << "  \"throughput_fps\": " << throughput_fps << "\n";
    oss << "}";

    return oss.str();
}

} // namespace hdrtel
