#include "wavekit/wavekit.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <audio.wav> [options]\n"
        << "\nOptions:\n"
        << "  --points N     Reduce to N points (default: 1000)\n"
        << "  --stream       Use the streaming reducer (default)\n"
        << "  --batch        Use the batch reducer\n"
        << "  --chunk N      Report progress every N points (default: 1024)\n"
        << "  --full-scan    Count samples by decoding instead of trusting the "
           "header\n"
        << "  --raw          Print decoded samples without reduction\n"
        << "  --info         Print header information only\n"
        << "  --csv          Print index,seconds,value rows\n"
        << "  --verbose      Print progress to stderr\n"
        << std::endl;
}

static bool parse_count(const std::string &text, size_t &out) {
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(text, &pos);
        if (pos != text.size())
            return false;
        out = static_cast<size_t>(v);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

int main(int argc, char *argv[]) {
    using namespace wavekit;
    using Clock = std::chrono::high_resolution_clock;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {

        // Parse arguments
        std::string audio_path = argv[1];
        ProcessConfig cfg = make_viewer_config();
        bool info_only = false;
        bool csv = false;
        bool verbose = false;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--stream") {
                cfg.reduce.streaming = true;
            } else if (arg == "--batch") {
                cfg.reduce.streaming = false;
            } else if (arg == "--full-scan") {
                cfg.length_hint = LengthHint::FullScan;
            } else if (arg == "--raw") {
                cfg.reduce.target_length = 0;
            } else if (arg == "--info") {
                info_only = true;
            } else if (arg == "--csv") {
                csv = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--points" && i + 1 < argc) {
                if (!parse_count(argv[++i], cfg.reduce.target_length) ||
                    cfg.reduce.target_length == 0) {
                    std::cerr << "Invalid point count: " << argv[i]
                              << std::endl;
                    return 1;
                }
            } else if (arg == "--chunk" && i + 1 < argc) {
                if (!parse_count(argv[++i], cfg.chunk_size)) {
                    std::cerr << "Invalid chunk size: " << argv[i]
                              << std::endl;
                    return 1;
                }
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (!has_wav_extension(audio_path)) {
            std::cerr << "Warning: " << audio_path
                      << " does not have a .wav extension" << std::endl;
        }

        // 1. Read file
        auto t0 = Clock::now();
        auto bytes = read_file_bytes(audio_path);
        if (!is_wav_magic(bytes.data(), bytes.size())) {
            std::cerr << "Warning: RIFF/WAVE signature not found" << std::endl;
        }

        // 2. Header
        auto header = parse_header(bytes);
        std::cerr << "Reading audio: " << audio_path << std::endl;
        std::cerr << "  Sample rate: " << header.sample_rate
                  << ", channels: " << header.channel_count
                  << ", bits: " << header.bits_per_sample
                  << ", frames: " << header.frame_count() << std::endl;
        std::cerr << "  Data: offset " << header.data_offset << ", "
                  << header.data_length << " bytes, " << std::fixed
                  << std::setprecision(3) << duration_seconds(header) << " s"
                  << std::endl;

        if (info_only)
            return 0;

        // 3. Decode + reduce
        ProcessCallbacks callbacks;
        if (verbose) {
            callbacks.on_chunk = [](const std::vector<double> &chunk,
                                    size_t start) {
                std::cerr << "  points " << start << "-"
                          << start + chunk.size() << std::endl;
            };
        }
        auto result = process_wav(bytes, cfg, callbacks);
        auto t1 = Clock::now();

        std::cerr << "  Reducer: "
                  << (cfg.reduce.target_length == 0 ? "none"
                      : cfg.reduce.streaming        ? "streaming"
                                                    : "batch")
                  << ", " << result.source_samples << " samples -> "
                  << result.points.size() << " points" << std::endl;
        std::cerr << "  Processing: "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(t1 -
                                                                           t0)
                         .count()
                  << " ms" << std::endl;

        // 4. Print points
        std::cout << std::setprecision(6);
        size_t n = result.points.size();
        if (csv)
            std::cout << "index,seconds,value\n";
        for (size_t i = 0; i < n; ++i) {
            if (csv) {
                std::cout << i << ","
                          << point_to_seconds(i, n, result.duration) << ","
                          << result.points[i] << "\n";
            } else {
                std::cout << result.points[i] << "\n";
            }
        }
        std::cout.flush();

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
