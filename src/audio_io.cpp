#include "wavekit/audio_io.hpp"

#include "wavekit/timeline.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace wavekit {

// ─── Format Detection ────────────────────────────────────────────────────────

bool has_wav_extension(const std::string &path) {
    auto dot = path.rfind('.');
    if (dot == std::string::npos)
        return false;

    std::string ext = path.substr(dot + 1);
    for (auto &c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    return ext == "wav" || ext == "wave";
}

bool is_wav_magic(const uint8_t *data, size_t len) {
    // RIFF....WAVE
    return len >= 12 && data[0] == 'R' && data[1] == 'I' && data[2] == 'F' &&
           data[3] == 'F' && data[8] == 'W' && data[9] == 'A' &&
           data[10] == 'V' && data[11] == 'E';
}

// ─── File Loading ────────────────────────────────────────────────────────────

std::vector<uint8_t> read_file_bytes(const std::string &path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open audio file: " + path);
    }

    auto end = file.tellg();
    if (end < 0) {
        throw std::runtime_error("Cannot determine size of audio file: " +
                                 path);
    }
    size_t size = static_cast<size_t>(end);
    file.seekg(0);

    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        file.read(reinterpret_cast<char *>(buffer.data()),
                  static_cast<std::streamsize>(size));
        if (static_cast<size_t>(file.gcount()) != size) {
            throw std::runtime_error("Failed reading audio file: " + path);
        }
    }
    return buffer;
}

WaveHeader read_wav_header(const std::string &path) {
    auto bytes = read_file_bytes(path);
    return parse_header(bytes);
}

// ─── Duration Query ──────────────────────────────────────────────────────────

double get_wav_duration(const std::string &path) {
    return duration_seconds(read_wav_header(path));
}

} // namespace wavekit
