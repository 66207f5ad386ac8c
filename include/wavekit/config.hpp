#pragma once

#include <cstddef>

namespace wavekit {

// ─── Reduce Config ──────────────────────────────────────────────────────────

struct ReduceConfig {
    size_t target_length = 1000; // output points; 0 = no reduction
    bool streaming = true;       // StreamingReducer instead of reduce()
};

// ─── Process Config ─────────────────────────────────────────────────────────

// Where the streaming reducer gets its total-length hint from.
enum class LengthHint {
    Header,   // data chunk byte length / frame size (no extra decode)
    FullScan, // decode everything once just to count samples
};

struct ProcessConfig {
    ReduceConfig reduce;
    size_t chunk_size = 1024; // values per on_chunk callback
    LengthHint length_hint = LengthHint::Header;
};

// ─── Presets ────────────────────────────────────────────────────────────────

// Full-width waveform in the recording viewer
inline ProcessConfig make_viewer_config() {
    ProcessConfig cfg;
    cfg.reduce.target_length = 1000;
    return cfg;
}

// Thumbnail-sized waveform for list rows
inline ProcessConfig make_preview_config() {
    ProcessConfig cfg;
    cfg.reduce.target_length = 500;
    return cfg;
}

// Every decoded sample, no reduction
inline ProcessConfig make_raw_config() {
    ProcessConfig cfg;
    cfg.reduce.target_length = 0;
    return cfg;
}

} // namespace wavekit
