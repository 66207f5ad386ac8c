#include "wavekit/samples.hpp"

#include <stdexcept>
#include <string>

namespace wavekit {

// ─── Sample Reader ──────────────────────────────────────────────────────────

SampleReader::SampleReader(const uint8_t *data, size_t size,
                           const WaveHeader &header) {
    BitDepth depth = validate_format(header);
    decode_ = sample_decoder(depth);
    stride_ = static_cast<size_t>(bytes_per_sample(depth));
    channels_ = header.channel_count;
    frame_count_ = header.frame_count();

    // parse_header guarantees this; a hand-built header may not
    if (header.data_offset > size ||
        header.data_length > size - header.data_offset) {
        throw std::invalid_argument(
            "Invalid WAV header: data region [" +
                std::to_string(header.data_offset) + ", +" +
                std::to_string(header.data_length) + ") exceeds buffer of " +
                std::to_string(size) + " bytes");
    }
    cursor_ = data + header.data_offset;
}

bool SampleReader::next(double &sample) {
    if (position_ >= frame_count_)
        return false;

    if (channels_ == 2) {
        double left = decode_(cursor_);
        double right = decode_(cursor_ + stride_);
        sample = (left + right) / 2.0;
        cursor_ += 2 * stride_;
    } else {
        sample = decode_(cursor_);
        cursor_ += stride_;
    }
    ++position_;
    return true;
}

// ─── Sample Sequence ────────────────────────────────────────────────────────

SampleSequence::iterator::iterator(SampleReader reader, size_t end_index)
    : reader_(reader), end_index_(end_index) {
    // Prime the first value; an empty sequence starts at end
    if (!reader_.next(value_))
        index_ = end_index_;
}

void SampleSequence::iterator::advance() {
    ++index_;
    if (index_ < end_index_ && !reader_.next(value_))
        index_ = end_index_;
}

SampleSequence::SampleSequence(const uint8_t *data, size_t size,
                               const WaveHeader &header)
    : data_(data), size_(size), header_(header),
      frame_count_(SampleReader(data, size, header).frame_count()) {}

SampleReader SampleSequence::reader() const {
    return SampleReader(data_, size_, header_);
}

SampleSequence::iterator SampleSequence::begin() const {
    return iterator(reader(), frame_count_);
}

SampleSequence::iterator SampleSequence::end() const {
    return iterator(frame_count_);
}

std::vector<double> SampleSequence::to_vector() const {
    std::vector<double> samples;
    samples.reserve(frame_count_);
    for (double s : *this)
        samples.push_back(s);
    return samples;
}

// ─── Decoding Entry Points ──────────────────────────────────────────────────

SampleSequence decode_samples(const uint8_t *data, size_t size,
                              const WaveHeader &header) {
    return SampleSequence(data, size, header);
}

SampleSequence decode_samples(const std::vector<uint8_t> &bytes,
                              const WaveHeader &header) {
    return SampleSequence(bytes.data(), bytes.size(), header);
}

std::vector<double> extract_samples(const uint8_t *data, size_t size) {
    auto header = parse_header(data, size);
    return decode_samples(data, size, header).to_vector();
}

std::vector<double> extract_samples(const std::vector<uint8_t> &bytes) {
    return extract_samples(bytes.data(), bytes.size());
}

} // namespace wavekit
