#include "wavekit/processor.hpp"

#include "wavekit/audio_io.hpp"
#include "wavekit/reduce.hpp"
#include "wavekit/samples.hpp"
#include "wavekit/timeline.hpp"

namespace wavekit {

namespace {

// Collects output values and drives the per-sample / per-chunk callbacks
class OutputSink {
  public:
    OutputSink(std::vector<double> &out, size_t chunk_size,
               const ProcessCallbacks &callbacks)
        : out_(out), chunk_size_(chunk_size), callbacks_(callbacks) {}

    void add(double value) {
        size_t index = out_.size();
        out_.push_back(value);

        if (callbacks_.on_sample)
            callbacks_.on_sample(value, index);

        if (!callbacks_.on_chunk)
            return;
        chunk_.push_back(value);
        if (chunk_size_ > 0 && chunk_.size() >= chunk_size_)
            flush_chunk();
    }

    void add_all(std::vector<double> &values) {
        for (double v : values)
            add(v);
        values.clear();
    }

    // Final partial chunk
    void finish() {
        if (callbacks_.on_chunk && !chunk_.empty())
            flush_chunk();
    }

  private:
    void flush_chunk() {
        size_t start = out_.size() - chunk_.size();
        callbacks_.on_chunk(chunk_, start);
        chunk_.clear();
    }

    std::vector<double> &out_;
    size_t chunk_size_;
    const ProcessCallbacks &callbacks_;
    std::vector<double> chunk_;
};

bool stop_requested(const ProcessCallbacks &callbacks) {
    return callbacks.should_stop && callbacks.should_stop();
}

// Length hint for the streaming reducer
size_t length_hint(const SampleSequence &samples, LengthHint mode) {
    if (mode == LengthHint::FullScan) {
        size_t count = 0;
        for (auto it = samples.begin(); it != samples.end(); ++it)
            ++count;
        return count;
    }
    return samples.size();
}

} // namespace

WaveformResult process_wav(const uint8_t *data, size_t size,
                           const ProcessConfig &config,
                           const ProcessCallbacks &callbacks) {
    WaveformResult result;
    result.header = parse_header(data, size);
    result.duration = duration_seconds(result.header);

    auto samples = decode_samples(data, size, result.header);
    auto reader = samples.reader();
    OutputSink sink(result.points, config.chunk_size, callbacks);
    size_t target = config.reduce.target_length;
    double sample;

    if (target == 0) {
        // No reduction: every decoded sample is an output value
        while (reader.next(sample)) {
            if (stop_requested(callbacks)) {
                result.cancelled = true;
                break;
            }
            sink.add(sample);
            ++result.source_samples;
        }
    } else if (config.reduce.streaming) {
        StreamingReducer reducer(target,
                                 length_hint(samples, config.length_hint));
        std::vector<double> points;
        while (reader.next(sample)) {
            if (stop_requested(callbacks)) {
                result.cancelled = true;
                break;
            }
            reducer.push(sample, points);
            ++result.source_samples;
            sink.add_all(points);
        }
        if (!result.cancelled) {
            reducer.finish(points);
            sink.add_all(points);
        }
    } else {
        std::vector<double> all;
        all.reserve(samples.size());
        while (reader.next(sample)) {
            if (stop_requested(callbacks)) {
                result.cancelled = true;
                break;
            }
            all.push_back(sample);
        }
        result.source_samples = all.size();
        if (!result.cancelled) {
            auto points = reduce(all, target);
            sink.add_all(points);
        }
    }

    if (!result.cancelled)
        sink.finish();

    return result;
}

WaveformResult process_wav(const std::vector<uint8_t> &bytes,
                           const ProcessConfig &config,
                           const ProcessCallbacks &callbacks) {
    return process_wav(bytes.data(), bytes.size(), config, callbacks);
}

WaveformResult process_wav_file(const std::string &path,
                                const ProcessConfig &config,
                                const ProcessCallbacks &callbacks) {
    auto bytes = read_file_bytes(path);
    return process_wav(bytes, config, callbacks);
}

} // namespace wavekit
