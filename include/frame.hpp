#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>

namespace hdrtel {

/**
 * Represents a single 8-bit interleaved video frame with metadata.
 * Engine frames are BGR ordered with 3 channels.
 */
struct Frame {
    std::vector<uint8_t> data;   // row-major, channels interleaved
    uint32_t width;
    uint32_t height;
    uint32_t channels;
    uint32_t frame_index;
    uint64_t timestamp;          // microseconds

    Frame() : width(0), height(0), channels(3), frame_index(0), timestamp(0) {}

    Frame(uint32_t w, uint32_t h, uint32_t c = 3, uint32_t idx = 0, uint64_t ts = 0)
        : data(static_cast<size_t>(w) * h * c, 0), width(w), height(h), channels(c),
          frame_index(idx), timestamp(ts) {}

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }

    size_t byte_count() const { return pixel_count() * channels; }

    bool is_valid() const {
        return !data.empty() && width > 0 && height > 0 && channels > 0
               && data.size() == byte_count();
    }
};

/**
 * Raised when a frame handed to the processor is structurally unusable
 * (wrong channel count, zero-sized, buffer length mismatch).
 */
class InvalidFrameFormat : public std::runtime_error {
public:
    explicit InvalidFrameFormat(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace hdrtel
