#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "wavekit/wav.hpp"

namespace wavekit {

// Whole file into memory. Throws std::runtime_error on open/read failure.
std::vector<uint8_t> read_file_bytes(const std::string &path);

// Parsed header of a WAV file on disk
WaveHeader read_wav_header(const std::string &path);

// Duration query (header only, no sample decode)
double get_wav_duration(const std::string &path);

// Format detection helpers
bool has_wav_extension(const std::string &path);
bool is_wav_magic(const uint8_t *data, size_t len);

} // namespace wavekit
