#include "wavekit/wav.hpp"

#include <algorithm>
#include <cstring>

namespace wavekit {

namespace {

// Layout of the fmt chunk body (all little endian)
constexpr size_t FMT_FORMAT_TAG = 0;
constexpr size_t FMT_CHANNELS = 2;
constexpr size_t FMT_SAMPLE_RATE = 4;
constexpr size_t FMT_BLOCK_ALIGN = 12;
constexpr size_t FMT_BITS_PER_SAMPLE = 14;
constexpr size_t FMT_MIN_SIZE = 16;
// WAVE_FORMAT_EXTENSIBLE: the SubFormat GUID starts with the format code
constexpr size_t FMT_SUB_FORMAT = 24;
constexpr size_t FMT_EXTENSIBLE_SIZE = 40;

constexpr size_t CHUNK_HEADER_SIZE = 8;

bool tag_equals(const uint8_t *p, const char *tag) {
    return std::memcmp(p, tag, 4) == 0;
}

// Tag bytes as text, with non-printable bytes shown as \xNN
std::string printable_tag(const uint8_t *p) {
    static const char *hex = "0123456789ABCDEF";
    std::string out;
    for (int i = 0; i < 4; ++i) {
        uint8_t c = p[i];
        if (c >= 0x20 && c < 0x7F) {
            out += static_cast<char>(c);
        } else {
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace

size_t WaveHeader::frame_count() const {
    int bps = bytes_per_sample();
    if (bps <= 0 || channel_count <= 0)
        return 0;
    return data_length / static_cast<size_t>(bps) /
           static_cast<size_t>(channel_count);
}

// ─── Errors ─────────────────────────────────────────────────────────────────

MalformedHeaderError::MalformedHeaderError(Reason reason,
                                           const std::string &message,
                                           std::string found_tag)
    : WavError(message), reason_(reason), found_tag_(std::move(found_tag)) {}

UnsupportedFormatError::UnsupportedFormatError(const WaveHeader &header,
                                               const std::string &message)
    : WavError(message), bits_per_sample_(header.bits_per_sample),
      channel_count_(header.channel_count), format_tag_(header.format_tag) {}

// ─── Header Parsing ─────────────────────────────────────────────────────────

WaveHeader parse_header(const uint8_t *data, size_t size) {
    if (size < MIN_WAV_SIZE) {
        throw MalformedHeaderError(MalformedHeaderError::Reason::TooSmall,
                                   "Invalid WAV file: too small (" +
                                       std::to_string(size) + " bytes)");
    }
    if (!tag_equals(data, "RIFF")) {
        auto found = printable_tag(data);
        throw MalformedHeaderError(
            MalformedHeaderError::Reason::BadRiffTag,
            "Invalid WAV file: expected 'RIFF' tag, found '" + found + "'",
            found);
    }
    if (!tag_equals(data + 8, "WAVE")) {
        auto found = printable_tag(data + 8);
        throw MalformedHeaderError(
            MalformedHeaderError::Reason::BadWaveTag,
            "Invalid WAV file: expected 'WAVE' tag, found '" + found + "'",
            found);
    }

    // Scan chunks (don't assume a fixed 44-byte layout)
    WaveHeader header;
    bool found_fmt = false;
    bool found_data = false;
    size_t offset = 12;

    while (offset + CHUNK_HEADER_SIZE <= size) {
        const uint8_t *chunk = data + offset;
        uint32_t chunk_size = read_le32(chunk + 4);
        size_t body = offset + CHUNK_HEADER_SIZE;

        if (tag_equals(chunk, "fmt ")) {
            // A truncated fmt body is ignored
            if (body + FMT_MIN_SIZE <= size) {
                const uint8_t *fmt = data + body;
                header.format_tag = read_le16(fmt + FMT_FORMAT_TAG);
                header.channel_count = read_le16(fmt + FMT_CHANNELS);
                header.sample_rate = read_le32(fmt + FMT_SAMPLE_RATE);
                header.block_align = read_le16(fmt + FMT_BLOCK_ALIGN);
                header.bits_per_sample = read_le16(fmt + FMT_BITS_PER_SAMPLE);
                header.sub_format = 0;
                if (header.format_tag == WAVE_FORMAT_EXTENSIBLE &&
                    chunk_size >= FMT_EXTENSIBLE_SIZE &&
                    body + FMT_EXTENSIBLE_SIZE <= size) {
                    header.sub_format = read_le16(fmt + FMT_SUB_FORMAT);
                }
                found_fmt = true;
            }
        } else if (tag_equals(chunk, "data")) {
            size_t remaining = size - body;
            header.data_offset = body;
            // Zero is the placeholder size left by streaming recorders
            header.data_length =
                chunk_size == 0
                    ? remaining
                    : std::min(static_cast<size_t>(chunk_size), remaining);
            found_data = true;
            break;
        }

        // Advance to next chunk (chunks are word-aligned)
        size_t padded = (static_cast<size_t>(chunk_size) + 1) & ~size_t{1};
        if (padded > size - body)
            break;
        offset = body + padded;
    }

    if (!found_fmt) {
        throw MalformedHeaderError(
            MalformedHeaderError::Reason::MissingFmtChunk,
            "Invalid WAV file: no 'fmt ' chunk (" +
                std::to_string(size) + " bytes)");
    }
    if (!found_data) {
        throw MalformedHeaderError(
            MalformedHeaderError::Reason::MissingDataChunk,
            "Invalid WAV file: no 'data' chunk (" + std::to_string(size) +
                " bytes)");
    }

    return header;
}

WaveHeader parse_header(const std::vector<uint8_t> &bytes) {
    return parse_header(bytes.data(), bytes.size());
}

BitDepth validate_format(const WaveHeader &header) {
    if (header.format_tag != WAVE_FORMAT_PCM &&
        header.format_tag != WAVE_FORMAT_EXTENSIBLE) {
        throw UnsupportedFormatError(
            header, "Unsupported WAV format: format=" +
                        std::to_string(header.format_tag) +
                        " (only linear PCM is supported)");
    }
    if (header.format_tag == WAVE_FORMAT_EXTENSIBLE &&
        header.sub_format != WAVE_FORMAT_PCM) {
        throw UnsupportedFormatError(
            header, "Unsupported WAV format: extensible SubFormat=" +
                        std::to_string(header.sub_format) +
                        " (only linear PCM is supported)");
    }
    BitDepth depth;
    if (!bit_depth_from_bits(header.bits_per_sample, depth)) {
        throw UnsupportedFormatError(
            header, "Unsupported bit depth: " +
                        std::to_string(header.bits_per_sample) +
                        " (expected 8, 16, 24 or 32)");
    }
    if (header.channel_count != 1 && header.channel_count != 2) {
        throw UnsupportedFormatError(
            header, "Unsupported channel count: " +
                        std::to_string(header.channel_count) +
                        " (expected 1 or 2)");
    }
    return depth;
}

} // namespace wavekit
