#include "wavekit/reduce.hpp"

#include <cmath>
#include <iterator>
#include <stdexcept>

namespace wavekit {

// ─── Signed RMS ─────────────────────────────────────────────────────────────

double BucketAccumulator::value() const {
    if (count == 0)
        return 0.0;
    double n = static_cast<double>(count);
    double rms = std::sqrt(sum_squares / n);
    double mean_sign = sign_sum / n;
    return rms * sign_of(mean_sign);
}

double signed_rms(const double *samples, size_t count) {
    BucketAccumulator acc;
    for (size_t i = 0; i < count; ++i)
        acc.add(samples[i]);
    return acc.value();
}

// ─── Bucketing ──────────────────────────────────────────────────────────────

size_t bucket_boundary(size_t index, size_t length, size_t target_length) {
    // index * length fits easily for any realistic recording length
    return index * length / target_length;
}

// ─── Batch Reduction ────────────────────────────────────────────────────────

std::vector<double> reduce(const double *samples, size_t count,
                           size_t target_length) {
    if (target_length == 0)
        throw std::invalid_argument("reduce: target_length must be positive");

    if (count <= target_length)
        return std::vector<double>(samples, samples + count);

    std::vector<double> points;
    points.reserve(target_length);

    BucketAccumulator acc;
    size_t start = 0;
    for (size_t i = 0; i < target_length; ++i) {
        size_t end = bucket_boundary(i + 1, count, target_length);
        acc.clear();
        for (size_t j = start; j < end; ++j)
            acc.add(samples[j]);
        points.push_back(acc.value());
        start = end;
    }

    return points;
}

std::vector<double> reduce(const std::vector<double> &samples,
                           size_t target_length) {
    return reduce(samples.data(), samples.size(), target_length);
}

// ─── Streaming Reduction ────────────────────────────────────────────────────

StreamingReducer::StreamingReducer(size_t target_length,
                                   size_t total_length_hint)
    : target_length_(target_length), total_length_hint_(total_length_hint),
      passthrough_(total_length_hint <= target_length) {
    if (target_length == 0) {
        throw std::invalid_argument(
            "StreamingReducer: target_length must be positive");
    }
    reset();
}

void StreamingReducer::reset() {
    current_bucket_ = 0;
    bucket_end_ =
        passthrough_
            ? 0
            : bucket_boundary(1, total_length_hint_, target_length_);
    acc_.clear();
    samples_seen_ = 0;
    points_emitted_ = 0;
}

void StreamingReducer::emit(double point, std::vector<double> &points) {
    points.push_back(point);
    ++points_emitted_;
}

void StreamingReducer::push(double sample, std::vector<double> &points) {
    size_t index = samples_seen_++;

    if (passthrough_) {
        emit(sample, points);
        return;
    }

    // Close every bucket that ends at or before this sample. Past the hinted
    // length (hint smaller than the real length) buckets keep the same
    // spacing, so the overflow still yields points.
    while (index >= bucket_end_) {
        emit(acc_.value(), points);
        acc_.clear();
        ++current_bucket_;
        bucket_end_ = bucket_boundary(current_bucket_ + 1, total_length_hint_,
                                      target_length_);
    }

    acc_.add(sample);
}

std::vector<double> StreamingReducer::process_chunk(const double *samples,
                                                    size_t count) {
    std::vector<double> points;
    for (size_t i = 0; i < count; ++i)
        push(samples[i], points);
    return points;
}

void StreamingReducer::finish(std::vector<double> &points) {
    if (passthrough_)
        return;
    if (acc_.count > 0) {
        emit(acc_.value(), points);
        acc_.clear();
        ++current_bucket_;
        bucket_end_ = bucket_boundary(current_bucket_ + 1, total_length_hint_,
                                      target_length_);
    }
}

std::vector<double> reduce_streaming(const std::vector<double> &samples,
                                     size_t target_length,
                                     size_t total_length_hint) {
    std::vector<double> points;
    reduce_streaming(samples.begin(), samples.end(), target_length,
                     total_length_hint, std::back_inserter(points));
    return points;
}

} // namespace wavekit
