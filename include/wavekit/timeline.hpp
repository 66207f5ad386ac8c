#pragma once

#include <cstddef>
#include <cstdint>

#include "wavekit/wav.hpp"

namespace wavekit {

// ─── Sample ↔ Time Conversion ───────────────────────────────────────────────

inline double sample_to_seconds(size_t sample, uint32_t sample_rate) {
    if (sample_rate == 0)
        return 0.0;
    return static_cast<double>(sample) / static_cast<double>(sample_rate);
}

// Length of the decoded mono signal. 0 when the header has no sample rate.
inline double duration_seconds(const WaveHeader &header) {
    return sample_to_seconds(header.frame_count(), header.sample_rate);
}

// ─── Point ↔ Time Conversion ────────────────────────────────────────────────

// Reduced points spread evenly over the duration: point p starts at
// p / num_points * duration.

double point_to_seconds(size_t point, size_t num_points, double duration);

// Point under a time position (seek-by-click, playhead).
// Clamped to [0, num_points - 1]; 0 when there are no points.
size_t seconds_to_point(double seconds, size_t num_points, double duration);

struct PointRange {
    size_t begin; // first point
    size_t end;   // one past last point
};

// Points covering [start_s, end_s), e.g. to highlight an annotation.
// Empty range when the span is empty or outside the waveform.
PointRange point_range(double start_s, double end_s, size_t num_points,
                       double duration);

} // namespace wavekit
