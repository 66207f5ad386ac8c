#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "wavekit/config.hpp"
#include "wavekit/wav.hpp"

namespace wavekit {

// ─── Waveform Result ────────────────────────────────────────────────────────

struct WaveformResult {
    WaveHeader header;
    std::vector<double> points; // reduced points, or raw samples
    size_t source_samples = 0;  // mono samples consumed from the buffer
    double duration = 0.0;      // seconds, from the header
    bool cancelled = false;     // should_stop() ended processing early
};

// ─── Callbacks ──────────────────────────────────────────────────────────────

struct ProcessCallbacks {
    // Each output value with its index in WaveformResult::points
    std::function<void(double value, size_t index)> on_sample;

    // Every chunk_size output values, then once for the remainder.
    // chunk_size == 0 delivers everything as one final chunk.
    std::function<void(const std::vector<double> &chunk, size_t start_index)>
        on_chunk;

    // Polled before each input sample. Returning true stops consumption;
    // the bucket being filled and the pending chunk are dropped.
    std::function<bool()> should_stop;
};

// ─── Processing ─────────────────────────────────────────────────────────────

/// Decode a WAV buffer and optionally reduce it for display.
///
///   auto bytes = wavekit::read_file_bytes("take1.wav");
///   auto result = wavekit::process_wav(bytes, wavekit::make_viewer_config());
///   draw(result.points);
///
/// Throws MalformedHeaderError / UnsupportedFormatError before any callback
/// fires.
WaveformResult process_wav(const uint8_t *data, size_t size,
                           const ProcessConfig &config = make_viewer_config(),
                           const ProcessCallbacks &callbacks = {});

WaveformResult process_wav(const std::vector<uint8_t> &bytes,
                           const ProcessConfig &config = make_viewer_config(),
                           const ProcessCallbacks &callbacks = {});

// Same, reading the file first.
WaveformResult process_wav_file(const std::string &path,
                                const ProcessConfig &config =
                                    make_viewer_config(),
                                const ProcessCallbacks &callbacks = {});

} // namespace wavekit
