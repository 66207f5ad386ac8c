#pragma once

#include <cstddef>
#include <vector>

namespace wavekit {

// ─── Signed RMS ─────────────────────────────────────────────────────────────

inline double sign_of(double x) {
    if (x > 0.0)
        return 1.0;
    if (x < 0.0)
        return -1.0;
    return 0.0;
}

// Running sums for one bucket. Both reduction forms accumulate through this
// type in arrival order, which is what makes their output bit-identical.
struct BucketAccumulator {
    double sum_squares = 0.0;
    double sign_sum = 0.0;
    size_t count = 0;

    void add(double sample) {
        sum_squares += sample * sample;
        sign_sum += sign_of(sample);
        ++count;
    }

    // rms * sign(mean sign); 0.0 for an empty bucket.
    // A bucket whose signs cancel yields 0.0 whatever its energy.
    double value() const;

    void clear() {
        sum_squares = 0.0;
        sign_sum = 0.0;
        count = 0;
    }
};

double signed_rms(const double *samples, size_t count);

// ─── Bucketing ──────────────────────────────────────────────────────────────

// First sample index of bucket `index` when `length` samples are split into
// `target_length` buckets: floor(index * length / target_length), exact in
// integer arithmetic, so bucket_boundary(target_length) == length.
// Bucket i spans [bucket_boundary(i), bucket_boundary(i + 1)). Indices past
// target_length continue at the same spacing.
size_t bucket_boundary(size_t index, size_t length, size_t target_length);

// ─── Batch Reduction ────────────────────────────────────────────────────────

// Reduce samples to target_length signed-RMS points.
// Returns the input unchanged when it already fits.
// Throws std::invalid_argument if target_length is 0.
std::vector<double> reduce(const std::vector<double> &samples,
                           size_t target_length);
std::vector<double> reduce(const double *samples, size_t count,
                           size_t target_length);

// ─── Streaming Reduction ────────────────────────────────────────────────────

// Incremental form of reduce(). Keeps only the running sums of the bucket
// being filled. Bucket boundaries come from total_length_hint, so output
// matches reduce() exactly when the hint equals the number of samples pushed.
// With a wrong hint the buckets drift from a batch run over the real data,
// but no sample is dropped: past the hinted length, buckets keep opening at
// the same spacing and each one emits a point.
//
// When the hint fits in target_length every sample passes straight through.

class StreamingReducer {
  public:
    // Throws std::invalid_argument if target_length is 0.
    StreamingReducer(size_t target_length, size_t total_length_hint);

    // Feed one sample; completed points are appended to `points`.
    void push(double sample, std::vector<double> &points);

    // Feed a chunk; returns the points it completed (possibly none).
    std::vector<double> process_chunk(const double *samples, size_t count);

    // End of input: flush the bucket being filled, if it has samples.
    void finish(std::vector<double> &points);

    // Drop partial state without flushing (cancellation / new stream)
    void reset();

    bool passthrough() const { return passthrough_; }
    size_t samples_seen() const { return samples_seen_; }
    size_t points_emitted() const { return points_emitted_; }
    size_t target_length() const { return target_length_; }
    size_t total_length_hint() const { return total_length_hint_; }

  private:
    size_t target_length_;
    size_t total_length_hint_;
    bool passthrough_;

    size_t current_bucket_ = 0;
    size_t bucket_end_ = 0; // exclusive end of current bucket
    BucketAccumulator acc_;

    size_t samples_seen_ = 0;
    size_t points_emitted_ = 0;

    void emit(double point, std::vector<double> &points);
};

// Streaming reduction over any input range of doubles, e.g. a
// SampleSequence. Writes points to `out` as buckets complete.
template <typename InputIt, typename OutputIt>
OutputIt reduce_streaming(InputIt first, InputIt last, size_t target_length,
                          size_t total_length_hint, OutputIt out) {
    StreamingReducer reducer(target_length, total_length_hint);
    std::vector<double> points;
    for (; first != last; ++first) {
        reducer.push(*first, points);
        for (double p : points)
            *out++ = p;
        points.clear();
    }
    reducer.finish(points);
    for (double p : points)
        *out++ = p;
    return out;
}

std::vector<double> reduce_streaming(const std::vector<double> &samples,
                                     size_t target_length,
                                     size_t total_length_hint);

} // namespace wavekit
