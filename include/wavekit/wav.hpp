#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "wavekit/pcm.hpp"

namespace wavekit {

// ─── Format Tags ────────────────────────────────────────────────────────────

constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

// Smallest buffer that can hold RIFF/WAVE + fmt + data headers.
constexpr size_t MIN_WAV_SIZE = 44;

// ─── Wave Header ────────────────────────────────────────────────────────────

struct WaveHeader {
    int channel_count = 0;
    uint32_t sample_rate = 0;
    int bits_per_sample = 0; // as declared; validated on sample access
    uint16_t format_tag = 0;
    uint16_t sub_format = 0; // WAVE_FORMAT_EXTENSIBLE only: SubFormat code
    uint16_t block_align = 0;
    size_t data_offset = 0; // first sample byte within the source buffer
    size_t data_length = 0; // data_offset + data_length <= buffer size

    int bytes_per_sample() const { return bits_per_sample / 8; }

    // Mono frames the data region holds after downmix.
    // Trailing bytes that do not form a whole frame are not counted.
    size_t frame_count() const;
};

// ─── Errors ─────────────────────────────────────────────────────────────────

class WavError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class MalformedHeaderError : public WavError {
  public:
    enum class Reason {
        TooSmall,
        BadRiffTag,
        BadWaveTag,
        MissingFmtChunk,
        MissingDataChunk,
    };

    MalformedHeaderError(Reason reason, const std::string &message,
                         std::string found_tag = {});

    Reason reason() const { return reason_; }

    // Printable form of the tag read where RIFF/WAVE was expected.
    // Empty for reasons that are not tag mismatches.
    const std::string &found_tag() const { return found_tag_; }

  private:
    Reason reason_;
    std::string found_tag_;
};

class UnsupportedFormatError : public WavError {
  public:
    UnsupportedFormatError(const WaveHeader &header,
                           const std::string &message);

    int bits_per_sample() const { return bits_per_sample_; }
    int channel_count() const { return channel_count_; }
    uint16_t format_tag() const { return format_tag_; }

  private:
    int bits_per_sample_;
    int channel_count_;
    uint16_t format_tag_;
};

// ─── Header Parsing ─────────────────────────────────────────────────────────

// Parse the RIFF/WAVE container and locate the fmt and data chunks.
// Throws MalformedHeaderError. Bit depth, channel count and format tag are
// not checked here; see validate_format().
WaveHeader parse_header(const uint8_t *data, size_t size);
WaveHeader parse_header(const std::vector<uint8_t> &bytes);

// Throws UnsupportedFormatError unless the header describes 1 or 2 channels
// of 8/16/24/32-bit linear PCM. An extensible header must carry the PCM
// SubFormat. Returns the bit depth on success.
BitDepth validate_format(const WaveHeader &header);

} // namespace wavekit
