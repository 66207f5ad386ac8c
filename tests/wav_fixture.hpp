#pragma once

// In-memory WAV builder for tests

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wavekit::test {

struct FmtSpec {
    uint16_t format_tag = 1;
    uint16_t channels = 1;
    uint32_t sample_rate = 8000;
    uint16_t bits = 16;
};

struct Chunk {
    std::string id; // 4 chars
    std::vector<uint8_t> body;
};

inline void put_le16(std::vector<uint8_t> &b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>(v >> 8));
}

inline void put_le32(std::vector<uint8_t> &b, uint32_t v) {
    for (int i = 0; i < 4; ++i)
        b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

inline std::vector<uint8_t> fmt_body(const FmtSpec &fmt) {
    std::vector<uint8_t> b;
    uint16_t block_align =
        static_cast<uint16_t>(fmt.channels * ((fmt.bits + 7) / 8));
    put_le16(b, fmt.format_tag);
    put_le16(b, fmt.channels);
    put_le32(b, fmt.sample_rate);
    put_le32(b, fmt.sample_rate * block_align);
    put_le16(b, block_align);
    put_le16(b, fmt.bits);
    return b;
}

// 40-byte WAVE_FORMAT_EXTENSIBLE fmt body with the given SubFormat code
// (KSDATAFORMAT_SUBTYPE_* GUID: code, then the fixed 00000000-0010-8000-
// 00AA00389B71 tail)
inline std::vector<uint8_t> fmt_extensible_body(FmtSpec fmt,
                                                uint16_t sub_format) {
    fmt.format_tag = 0xFFFE;
    auto b = fmt_body(fmt);
    put_le16(b, 22);        // cbSize
    put_le16(b, fmt.bits);  // valid bits
    put_le32(b, fmt.channels == 2 ? 0x3 : 0x4); // channel mask
    put_le32(b, sub_format);
    put_le16(b, 0x0000);
    put_le16(b, 0x0010);
    for (uint8_t v : {0x80, 0x00, 0x00, 0xAA, 0x00, 0x38, 0x9B, 0x71})
        b.push_back(v);
    return b;
}

// RIFF/WAVE container around the given chunks, in order, word-aligned.
// `size_override` replaces the declared size of the data chunk when set.
inline std::vector<uint8_t> make_riff(const std::vector<Chunk> &chunks,
                                      int64_t data_size_override = -1) {
    std::vector<uint8_t> body;
    for (const auto &c : chunks) {
        body.insert(body.end(), c.id.begin(), c.id.begin() + 4);
        uint32_t declared = static_cast<uint32_t>(c.body.size());
        if (c.id == "data" && data_size_override >= 0)
            declared = static_cast<uint32_t>(data_size_override);
        put_le32(body, declared);
        body.insert(body.end(), c.body.begin(), c.body.end());
        if (c.body.size() % 2 != 0 && c.id != "data")
            body.push_back(0);
    }

    std::vector<uint8_t> out = {'R', 'I', 'F', 'F'};
    put_le32(out, static_cast<uint32_t>(4 + body.size()));
    out.insert(out.end(), {'W', 'A', 'V', 'E'});
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

// Canonical fmt + data layout
inline std::vector<uint8_t> make_wav(const FmtSpec &fmt,
                                     const std::vector<uint8_t> &data) {
    return make_riff({{"fmt ", fmt_body(fmt)}, {"data", data}});
}

// ─── PCM encoders (little endian) ───────────────────────────────────────────

inline std::vector<uint8_t> pcm8(const std::vector<uint8_t> &samples) {
    return samples;
}

inline std::vector<uint8_t> pcm16(const std::vector<int16_t> &samples) {
    std::vector<uint8_t> b;
    for (auto s : samples)
        put_le16(b, static_cast<uint16_t>(s));
    return b;
}

inline std::vector<uint8_t> pcm24(const std::vector<int32_t> &samples) {
    std::vector<uint8_t> b;
    for (auto s : samples) {
        auto u = static_cast<uint32_t>(s);
        b.push_back(static_cast<uint8_t>(u & 0xFF));
        b.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
        b.push_back(static_cast<uint8_t>((u >> 16) & 0xFF));
    }
    return b;
}

inline std::vector<uint8_t> pcm32(const std::vector<int32_t> &samples) {
    std::vector<uint8_t> b;
    for (auto s : samples)
        put_le32(b, static_cast<uint32_t>(s));
    return b;
}

} // namespace wavekit::test
