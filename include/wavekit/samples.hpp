#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "wavekit/pcm.hpp"
#include "wavekit/wav.hpp"

namespace wavekit {

// ─── Sample Reader ──────────────────────────────────────────────────────────

// Single-pass cursor over the data region of a WAV buffer. Produces one
// normalized mono sample per frame; stereo frames fold to (left + right) / 2.
// Does not own the buffer.

class SampleReader {
  public:
    SampleReader() = default;
    SampleReader(const uint8_t *data, size_t size, const WaveHeader &header);

    // Writes the next sample and returns true, or returns false once the
    // remaining bytes cannot form a whole frame.
    bool next(double &sample);

    // Frames consumed so far
    size_t position() const { return position_; }

    // Total frames this reader will produce
    size_t frame_count() const { return frame_count_; }

  private:
    const uint8_t *cursor_ = nullptr;
    SampleDecodeFn decode_ = nullptr;
    size_t stride_ = 0; // bytes per sample
    int channels_ = 1;
    size_t position_ = 0;
    size_t frame_count_ = 0;
};

// ─── Sample Sequence ────────────────────────────────────────────────────────

// Restartable, lazily decoded view of a WAV buffer's samples. Every begin()
// starts a fresh SampleReader, so iterating twice yields identical values.
// The buffer must outlive the sequence and must not change while in use.

class SampleSequence {
  public:
    class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = double;
        using difference_type = std::ptrdiff_t;
        using pointer = const double *;
        using reference = const double &;

        iterator() = default;

        reference operator*() const { return value_; }
        pointer operator->() const { return &value_; }

        iterator &operator++() {
            advance();
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            advance();
            return tmp;
        }

        bool operator==(const iterator &other) const {
            return index_ == other.index_;
        }
        bool operator!=(const iterator &other) const {
            return !(*this == other);
        }

      private:
        friend class SampleSequence;

        iterator(SampleReader reader, size_t end_index);
        explicit iterator(size_t end_index) : index_(end_index) {}

        void advance();

        SampleReader reader_;
        double value_ = 0.0;
        size_t index_ = 0;
        size_t end_index_ = 0;
    };

    // Throws UnsupportedFormatError before any sample is produced.
    SampleSequence(const uint8_t *data, size_t size, const WaveHeader &header);

    iterator begin() const;
    iterator end() const;

    size_t size() const { return frame_count_; }
    bool empty() const { return frame_count_ == 0; }

    const WaveHeader &header() const { return header_; }

    // Fresh single-pass cursor over the same samples
    SampleReader reader() const;

    // Materialize by consuming a fresh cursor to the end
    std::vector<double> to_vector() const;

  private:
    const uint8_t *data_;
    size_t size_;
    WaveHeader header_;
    size_t frame_count_;
};

// ─── Decoding Entry Points ──────────────────────────────────────────────────

// Lazy samples for an already parsed header.
SampleSequence decode_samples(const uint8_t *data, size_t size,
                              const WaveHeader &header);
SampleSequence decode_samples(const std::vector<uint8_t> &bytes,
                              const WaveHeader &header);

// Parse the header and materialize every sample.
// Throws MalformedHeaderError or UnsupportedFormatError.
std::vector<double> extract_samples(const uint8_t *data, size_t size);
std::vector<double> extract_samples(const std::vector<uint8_t> &bytes);

} // namespace wavekit
