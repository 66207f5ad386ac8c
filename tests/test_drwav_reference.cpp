// Cross-checks the wavekit decoder against dr_wav on the same buffers.

#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

#include <gtest/gtest.h>

#include "wavekit/wavekit.hpp"
#include "wav_fixture.hpp"

#include <random>

using namespace wavekit;
using namespace wavekit::test;

// ─── Helpers ────────────────────────────────────────────────────────────────

struct ReferenceDecode {
    unsigned channels = 0;
    unsigned sample_rate = 0;
    unsigned bits = 0;
    uint64_t frames = 0;
    std::vector<int32_t> interleaved; // raw codes, sign-extended
};

static ReferenceDecode decode_with_drwav(const std::vector<uint8_t> &bytes) {
    ReferenceDecode ref;
    drwav wav;
    if (!drwav_init_memory(&wav, bytes.data(), bytes.size(), nullptr)) {
        ADD_FAILURE() << "dr_wav rejected the buffer";
        return ref;
    }
    ref.channels = wav.channels;
    ref.sample_rate = wav.sampleRate;
    ref.bits = wav.bitsPerSample;
    ref.frames = wav.totalPCMFrameCount;

    std::vector<drwav_int32> s32(
        static_cast<size_t>(wav.totalPCMFrameCount) * wav.channels);
    drwav_uint64 read =
        drwav_read_pcm_frames_s32(&wav, wav.totalPCMFrameCount, s32.data());
    drwav_uninit(&wav);

    // dr_wav left-aligns every depth in 32 bits
    int shift = 32 - static_cast<int>(ref.bits);
    ref.interleaved.reserve(static_cast<size_t>(read) * ref.channels);
    for (size_t i = 0; i < static_cast<size_t>(read) * ref.channels; ++i)
        ref.interleaved.push_back(s32[i] >> shift);
    return ref;
}

static double scale_for(unsigned bits) {
    switch (bits) {
    case 8:
        return U8_SCALE;
    case 16:
        return S16_SCALE;
    case 24:
        return S24_SCALE;
    default:
        return S32_SCALE;
    }
}

static std::vector<uint8_t> random_wav(uint16_t channels, uint16_t bits,
                                       size_t frames, uint32_t seed) {
    std::mt19937 gen(seed);
    FmtSpec fmt;
    fmt.channels = channels;
    fmt.bits = bits;
    fmt.sample_rate = 44100;

    size_t n = frames * channels;
    switch (bits) {
    case 8: {
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<uint8_t> v(n);
        for (auto &s : v)
            s = static_cast<uint8_t>(dist(gen));
        return make_wav(fmt, pcm8(v));
    }
    case 16: {
        std::uniform_int_distribution<int> dist(-32768, 32767);
        std::vector<int16_t> v(n);
        for (auto &s : v)
            s = static_cast<int16_t>(dist(gen));
        return make_wav(fmt, pcm16(v));
    }
    case 24: {
        std::uniform_int_distribution<int32_t> dist(-8388608, 8388607);
        std::vector<int32_t> v(n);
        for (auto &s : v)
            s = dist(gen);
        return make_wav(fmt, pcm24(v));
    }
    default: {
        std::uniform_int_distribution<int32_t> dist(INT32_MIN, INT32_MAX);
        std::vector<int32_t> v(n);
        for (auto &s : v)
            s = dist(gen);
        return make_wav(fmt, pcm32(v));
    }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Reference decode
// ═══════════════════════════════════════════════════════════════════════════════

class DrWavReference
    : public ::testing::TestWithParam<std::pair<uint16_t, uint16_t>> {};

TEST_P(DrWavReference, HeaderFieldsAgree) {
    auto [channels, bits] = GetParam();
    auto bytes = random_wav(channels, bits, 777, 1);
    auto ref = decode_with_drwav(bytes);
    auto header = parse_header(bytes);

    EXPECT_EQ(static_cast<unsigned>(header.channel_count), ref.channels);
    EXPECT_EQ(header.sample_rate, ref.sample_rate);
    EXPECT_EQ(static_cast<unsigned>(header.bits_per_sample), ref.bits);
    EXPECT_EQ(header.frame_count(), ref.frames);
}

TEST_P(DrWavReference, SamplesAgree) {
    auto [channels, bits] = GetParam();
    auto bytes = random_wav(channels, bits, 4096, 2);
    auto ref = decode_with_drwav(bytes);
    auto samples = extract_samples(bytes);

    ASSERT_EQ(samples.size(), ref.frames);
    double scale = scale_for(bits);
    for (size_t i = 0; i < samples.size(); ++i) {
        double expected;
        if (channels == 2) {
            double left = ref.interleaved[2 * i] / scale;
            double right = ref.interleaved[2 * i + 1] / scale;
            expected = (left + right) / 2.0;
        } else {
            expected = ref.interleaved[i] / scale;
        }
        ASSERT_EQ(samples[i], expected) << "frame " << i;
    }
}

INSTANTIATE_TEST_SUITE_P(
    Layouts, DrWavReference,
    ::testing::Values(std::make_pair<uint16_t, uint16_t>(1, 8),
                      std::make_pair<uint16_t, uint16_t>(1, 16),
                      std::make_pair<uint16_t, uint16_t>(1, 24),
                      std::make_pair<uint16_t, uint16_t>(1, 32),
                      std::make_pair<uint16_t, uint16_t>(2, 8),
                      std::make_pair<uint16_t, uint16_t>(2, 16),
                      std::make_pair<uint16_t, uint16_t>(2, 24),
                      std::make_pair<uint16_t, uint16_t>(2, 32)));
