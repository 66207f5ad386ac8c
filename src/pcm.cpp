#include "wavekit/pcm.hpp"

namespace wavekit {

bool bit_depth_from_bits(int bits, BitDepth &out) {
    switch (bits) {
    case 8:
        out = BitDepth::U8;
        return true;
    case 16:
        out = BitDepth::S16;
        return true;
    case 24:
        out = BitDepth::S24;
        return true;
    case 32:
        out = BitDepth::S32;
        return true;
    default:
        return false;
    }
}

// ─── Per-Depth Decoders ─────────────────────────────────────────────────────

double decode_u8(const uint8_t *p) {
    return (static_cast<int>(p[0]) - 128) / U8_SCALE;
}

double decode_s16(const uint8_t *p) {
    auto v = static_cast<int16_t>(read_le16(p));
    return static_cast<double>(v) / S16_SCALE;
}

double decode_s24(const uint8_t *p) {
    int32_t v = static_cast<int32_t>(p[0]) |
                (static_cast<int32_t>(p[1]) << 8) |
                (static_cast<int32_t>(p[2]) << 16);
    // Sign-extend from bit 23
    if (v & 0x800000)
        v -= 0x1000000;
    return static_cast<double>(v) / S24_SCALE;
}

double decode_s32(const uint8_t *p) {
    auto v = static_cast<int32_t>(read_le32(p));
    return static_cast<double>(v) / S32_SCALE;
}

SampleDecodeFn sample_decoder(BitDepth depth) {
    switch (depth) {
    case BitDepth::U8:
        return &decode_u8;
    case BitDepth::S16:
        return &decode_s16;
    case BitDepth::S24:
        return &decode_s24;
    case BitDepth::S32:
        return &decode_s32;
    }
    return nullptr;
}

} // namespace wavekit
