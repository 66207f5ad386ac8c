#include "wavekit/wavekit.hpp"
#include "wav_fixture.hpp"

#include <benchmark/benchmark.h>

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static size_t flag_points = 1000;
static bool flag_markdown = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--points=")) {
            try {
                flag_points = static_cast<size_t>(std::stoul(arg.substr(9)));
            } catch (const std::exception &) {
                flag_points = 0;
            }
        } else if (arg == "--markdown")
            flag_markdown = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Parse audio_sec from benchmark name like "decode_stereo/5/real_time"
static int parse_audio_sec(const std::string &name) {
    auto first_slash = name.find('/');
    if (first_slash == std::string::npos)
        return 0;
    auto second_slash = name.find('/', first_slash + 1);
    std::string arg_str = (second_slash != std::string::npos)
                              ? name.substr(first_slash + 1,
                                            second_slash - first_slash - 1)
                              : name.substr(first_slash + 1);
    try {
        return std::stoi(arg_str);
    } catch (const std::exception &) {
        return 0;
    }
}

// Parse stage and layout from "decode_stereo/5/real_time" → ("decode",
// "stereo")
static std::pair<std::string, std::string>
parse_stage_layout(const std::string &name) {
    auto slash = name.find('/');
    std::string prefix =
        (slash != std::string::npos) ? name.substr(0, slash) : name;
    auto underscore = prefix.rfind('_');
    if (underscore != std::string::npos)
        return {prefix.substr(0, underscore), prefix.substr(underscore + 1)};
    return {prefix, ""};
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Stage | Layout | Audio (s) | Time (ms) | Realtime |\n";
        std::cout << "|-------|--------|-----------|-----------|----------|\n";

        for (const auto &r : runs_) {
            if (r.error_occurred)
                continue;

            auto [stage, layout] = parse_stage_layout(r.benchmark_name());
            int audio_sec = parse_audio_sec(r.benchmark_name());
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double speed = time_ms > 0 ? audio_sec * 1000.0 / time_ms : 0;

            std::cout << "| " << stage << " | " << layout << " | "
                      << audio_sec << " | " << std::fixed
                      << std::setprecision(3) << time_ms << " | "
                      << std::setprecision(0) << speed << "x |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic audio ────────────────────────────────────────────────────────

constexpr uint32_t BENCH_SAMPLE_RATE = 44100;

// 16-bit PCM speech-like signal: 220 Hz tone with a 3 Hz envelope
static std::vector<uint8_t> make_bench_wav(int seconds, int channels) {
    size_t frames = static_cast<size_t>(seconds) * BENCH_SAMPLE_RATE;
    std::vector<int16_t> pcm;
    pcm.reserve(frames * static_cast<size_t>(channels));

    for (size_t i = 0; i < frames; ++i) {
        double t = static_cast<double>(i) / BENCH_SAMPLE_RATE;
        double env = 0.5 + 0.5 * std::sin(2.0 * M_PI * 3.0 * t);
        double v = env * std::sin(2.0 * M_PI * 220.0 * t);
        auto s = static_cast<int16_t>(v * 30000.0);
        for (int c = 0; c < channels; ++c)
            pcm.push_back(s);
    }

    wavekit::test::FmtSpec fmt;
    fmt.channels = static_cast<uint16_t>(channels);
    fmt.sample_rate = BENCH_SAMPLE_RATE;
    fmt.bits = 16;
    return wavekit::test::make_wav(fmt, wavekit::test::pcm16(pcm));
}

// ─── Audio cache ────────────────────────────────────────────────────────────

static const std::vector<uint8_t> &bench_wav(int seconds, int channels) {
    static std::map<std::pair<int, int>, std::vector<uint8_t>> cache;
    auto key = std::make_pair(seconds, channels);
    auto it = cache.find(key);
    if (it == cache.end())
        it = cache.emplace(key, make_bench_wav(seconds, channels)).first;
    return it->second;
}

static const std::vector<double> &bench_samples(int seconds, int channels) {
    static std::map<std::pair<int, int>, std::vector<double>> cache;
    auto key = std::make_pair(seconds, channels);
    auto it = cache.find(key);
    if (it == cache.end())
        it = cache
                 .emplace(key, wavekit::extract_samples(
                                   bench_wav(seconds, channels)))
                 .first;
    return it->second;
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static const std::vector<int64_t> audio_durations = {1, 5, 10, 30, 60};

static void add_duration_args(benchmark::internal::Benchmark *b) {
    for (auto d : audio_durations)
        b->Arg(d);
    b->UseRealTime()->Unit(benchmark::kMillisecond);
}

static void register_benchmarks() {
    for (int channels : {1, 2}) {
        std::string layout = channels == 1 ? "mono" : "stereo";

        // Header parse + full lazy decode
        add_duration_args(benchmark::RegisterBenchmark(
            ("decode_" + layout).c_str(), [channels](benchmark::State &state) {
                int audio_sec = static_cast<int>(state.range(0));
                const auto &bytes = bench_wav(audio_sec, channels);
                for (auto _ : state) {
                    auto samples = wavekit::extract_samples(bytes);
                    benchmark::DoNotOptimize(samples.data());
                }
                state.counters["Throughput"] = benchmark::Counter(
                    audio_sec, benchmark::Counter::kIsRate);
            }));

        // Batch reduction of already decoded samples
        add_duration_args(benchmark::RegisterBenchmark(
            ("reduce_" + layout).c_str(), [channels](benchmark::State &state) {
                int audio_sec = static_cast<int>(state.range(0));
                const auto &samples = bench_samples(audio_sec, channels);
                for (auto _ : state) {
                    auto points = wavekit::reduce(samples, flag_points);
                    benchmark::DoNotOptimize(points.data());
                }
                state.counters["Throughput"] = benchmark::Counter(
                    audio_sec, benchmark::Counter::kIsRate);
            }));

        // Decode feeding the streaming reducer, no materialized samples
        add_duration_args(benchmark::RegisterBenchmark(
            ("pipeline_" + layout).c_str(), [channels](benchmark::State &state) {
                int audio_sec = static_cast<int>(state.range(0));
                const auto &bytes = bench_wav(audio_sec, channels);
                auto cfg = wavekit::make_viewer_config();
                cfg.reduce.target_length = flag_points;
                for (auto _ : state) {
                    auto result = wavekit::process_wav(bytes, cfg);
                    benchmark::DoNotOptimize(result.points.data());
                }
                state.counters["Throughput"] = benchmark::Counter(
                    audio_sec, benchmark::Counter::kIsRate);
            }));
    }
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    if (flag_points == 0) {
        std::cerr
            << "Usage: wavekit_bench [options] [benchmark flags]\n\n"
            << "Options:\n"
            << "  --points=N          Reduced points per waveform (default "
               "1000, > 0)\n"
            << "  --markdown          Output as markdown table\n"
            << "\nGoogle Benchmark flags (passed through):\n"
            << "  --benchmark_filter=REGEX\n"
            << "  --benchmark_repetitions=N\n"
            << "  --benchmark_format={console|json|csv}\n"
            << std::endl;
        return 1;
    }

    benchmark::Initialize(&argc, argv);
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
