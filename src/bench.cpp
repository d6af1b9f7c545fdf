#include "audiotally/audiotally.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static std::string flag_dir;  // tally a real directory instead of fixtures
static int flag_files = 400;  // synthetic fixture count

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--dir="))
            flag_dir = arg.substr(6);
        else if (arg.starts_with("--files="))
            flag_files = std::stoi(arg.substr(8));
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Synthetic fixtures ─────────────────────────────────────────────────────

static void put_le32(std::vector<uint8_t> &b, uint32_t v) {
    for (int i = 0; i < 4; ++i)
        b.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

static void put_le16(std::vector<uint8_t> &b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v));
    b.push_back(static_cast<uint8_t>(v >> 8));
}

static void put_be32(std::vector<uint8_t> &b, uint32_t v) {
    for (int i = 3; i >= 0; --i)
        b.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

static void write_file(const fs::path &p, const std::vector<uint8_t> &b) {
    std::ofstream f(p, std::ios::binary);
    f.write(reinterpret_cast<const char *>(b.data()),
            static_cast<std::streamsize>(b.size()));
}

// 16-bit stereo PCM, `seconds` long at 8 kHz
static std::vector<uint8_t> make_wav(uint32_t seconds) {
    const uint32_t rate = 8000, block_align = 4;
    uint32_t data_bytes = seconds * rate * block_align;
    std::vector<uint8_t> b = {'R', 'I', 'F', 'F'};
    put_le32(b, 36 + data_bytes);
    b.insert(b.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    put_le32(b, 16);
    put_le16(b, 1);
    put_le16(b, 2);
    put_le32(b, rate);
    put_le32(b, rate * block_align);
    put_le16(b, block_align);
    put_le16(b, 16);
    b.insert(b.end(), {'d', 'a', 't', 'a'});
    put_le32(b, data_bytes);
    b.resize(b.size() + data_bytes, 0);
    return b;
}

// ftyp + moov/mvhd (version 0)
static std::vector<uint8_t> make_m4a(uint32_t seconds) {
    std::vector<uint8_t> b;
    put_be32(b, 16);
    b.insert(b.end(), {'f', 't', 'y', 'p', 'M', '4', 'A', ' '});
    put_be32(b, 0);
    put_be32(b, 8 + 108);
    b.insert(b.end(), {'m', 'o', 'o', 'v'});
    put_be32(b, 108);
    b.insert(b.end(), {'m', 'v', 'h', 'd'});
    std::vector<uint8_t> body(100, 0);
    uint32_t ts = 1000, dur = seconds * 1000;
    for (int i = 0; i < 4; ++i) {
        body[12 + i] = static_cast<uint8_t>(ts >> (24 - 8 * i));
        body[16 + i] = static_cast<uint8_t>(dur >> (24 - 8 * i));
    }
    b.insert(b.end(), body.begin(), body.end());
    return b;
}

// Per-run fixture directory, removed at shutdown
static fs::path fixture_dir;

static const std::vector<std::string> &fixture_files() {
    static std::vector<std::string> files = [] {
        std::random_device rd;
        auto dir = fs::temp_directory_path() /
                   ("audiotally-bench-" + std::to_string(rd()));
        fs::create_directories(dir);
        fixture_dir = dir;
        std::vector<std::string> out;
        for (int i = 0; i < flag_files; ++i) {
            auto p = dir / ("clip" + std::to_string(i) +
                            (i % 2 ? ".m4a" : ".wav"));
            write_file(p, i % 2 ? make_m4a(1 + i % 30)
                                : make_wav(1 + i % 5));
            out.push_back(p.string());
        }
        std::cerr << "Wrote " << out.size() << " fixtures to " << dir
                  << std::endl;
        return out;
    }();
    return files;
}

static void remove_fixtures() {
    if (fixture_dir.empty())
        return;
    std::error_code ec;
    fs::remove_all(fixture_dir, ec);
    if (ec) {
        std::cerr << "Could not remove " << fixture_dir << ": "
                  << ec.message() << std::endl;
    }
}

static const std::vector<std::string> &bench_files() {
    if (flag_dir.empty())
        return fixture_files();
    static std::vector<std::string> files =
        audiotally::collect_audio_files(flag_dir).files;
    return files;
}

// ─── Benchmarks ─────────────────────────────────────────────────────────────

static void BM_Tally(benchmark::State &state) {
    const auto &files = bench_files();
    audiotally::TallyConfig cfg;
    cfg.pool.num_workers = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto result = audiotally::tally_files(files, cfg);
        benchmark::DoNotOptimize(result.stats.total_seconds);
    }
    state.counters["Files"] = benchmark::Counter(
        static_cast<double>(files.size()) * state.iterations(),
        benchmark::Counter::kIsRate);
}

static void BM_ResolveDuration(benchmark::State &state) {
    const auto &files = bench_files();
    size_t i = 0;
    for (auto _ : state) {
        auto outcome = audiotally::resolve_duration(files[i++ % files.size()]);
        benchmark::DoNotOptimize(outcome.seconds);
    }
}

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);
    benchmark::Initialize(&argc, argv);

    if (bench_files().empty()) {
        std::cerr << "No audio files to benchmark" << std::endl;
        remove_fixtures();
        return 1;
    }

    benchmark::RegisterBenchmark("tally", BM_Tally)
        ->Arg(1)
        ->Arg(4)
        ->Arg(64)
        ->UseRealTime()
        ->Unit(benchmark::kMillisecond);
    benchmark::RegisterBenchmark("resolve_duration", BM_ResolveDuration)
        ->Unit(benchmark::kMicrosecond);

    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    remove_fixtures();
    return 0;
}
