#pragma once

#include <cstddef>
#include <cstdint>

namespace wavekit {

// ─── Bit Depth ──────────────────────────────────────────────────────────────

enum class BitDepth : uint16_t {
    U8 = 8,   // unsigned, offset 128
    S16 = 16, // signed two's complement
    S24 = 24, // signed, packed 3 bytes
    S32 = 32, // signed two's complement
};

inline int bytes_per_sample(BitDepth depth) {
    return static_cast<int>(depth) / 8;
}

// Maps a declared bits-per-sample value onto the closed set.
// Returns false for anything other than 8, 16, 24 or 32.
bool bit_depth_from_bits(int bits, BitDepth &out);

// ─── Little-Endian Reads ────────────────────────────────────────────────────

inline uint16_t read_le16(const uint8_t *p) {
    return static_cast<uint16_t>(p[0]) |
           static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8);
}

inline uint32_t read_le32(const uint8_t *p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// ─── Normalization ──────────────────────────────────────────────────────────

// Divisors are the positive-side maximum of each depth, not 2^(n-1). The
// most negative code therefore lands slightly below -1.0; stored reference
// waveforms depend on this exact scaling.
constexpr double U8_SCALE = 127.0;
constexpr double S16_SCALE = 32767.0;
constexpr double S24_SCALE = 8388607.0;
constexpr double S32_SCALE = 2147483647.0;

double decode_u8(const uint8_t *p);
double decode_s16(const uint8_t *p);
double decode_s24(const uint8_t *p);
double decode_s32(const uint8_t *p);

// Decodes one little-endian sample starting at p.
using SampleDecodeFn = double (*)(const uint8_t *p);

// Decode function for a depth; chosen once per sequence, not per sample.
SampleDecodeFn sample_decoder(BitDepth depth);

} // namespace wavekit
