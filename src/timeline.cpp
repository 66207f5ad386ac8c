#include "wavekit/timeline.hpp"

#include <algorithm>
#include <cmath>

namespace wavekit {

double point_to_seconds(size_t point, size_t num_points, double duration) {
    if (num_points == 0)
        return 0.0;
    return static_cast<double>(point) / static_cast<double>(num_points) *
           duration;
}

size_t seconds_to_point(double seconds, size_t num_points, double duration) {
    // Negated comparisons so NaN takes the early return too
    if (num_points == 0 || !(duration > 0.0) || !(seconds > 0.0))
        return 0;
    double pos = std::floor(seconds / duration * static_cast<double>(num_points));
    if (pos >= static_cast<double>(num_points - 1))
        return num_points - 1;
    return static_cast<size_t>(pos);
}

PointRange point_range(double start_s, double end_s, size_t num_points,
                       double duration) {
    if (num_points == 0 || std::isnan(start_s) || std::isnan(end_s) ||
        !(duration > 0.0) || end_s <= start_s || end_s <= 0.0 ||
        start_s >= duration) {
        return {0, 0};
    }
    double n = static_cast<double>(num_points);
    double first = std::floor(std::max(start_s, 0.0) / duration * n);
    double last = std::ceil(std::min(end_s, duration) / duration * n);
    size_t begin = static_cast<size_t>(first);
    size_t end = std::min(static_cast<size_t>(last), num_points);
    if (end <= begin)
        return {0, 0};
    return {begin, end};
}

} // namespace wavekit
