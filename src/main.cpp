#include "audiotally/audiotally.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <folder_path> [options]\n"
        << "\nOptions:\n"
        << "  --workers N      Worker threads (default: CPU core count)\n"
        << "  --count-nonzero  Count a file as processed only if its\n"
        << "                   duration is > 0 (legacy totals)\n"
        << "  --no-progress    Do not draw the progress bar\n"
        << "  --verbose        List per-file errors and early MP3 stops\n"
        << std::endl;
}

int main(int argc, char *argv[]) {
    using namespace audiotally;
    using Clock = std::chrono::steady_clock;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {

        // Parse arguments
        std::string folder_path = argv[1];
        TallyConfig cfg = make_default_config();

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--workers" && i + 1 < argc) {
                cfg.pool.num_workers = std::stoi(argv[++i]);
                if (cfg.pool.num_workers <= 0) {
                    std::cerr << "Error: --workers must be positive"
                              << std::endl;
                    return 1;
                }
            } else if (arg == "--count-nonzero") {
                cfg.counting = CountingMode::NonZeroDuration;
            } else if (arg == "--no-progress") {
                cfg.show_progress = false;
            } else if (arg == "--verbose") {
                cfg.verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        // 1. Discover files
        auto scan = collect_audio_files(folder_path);
        std::cout << "Scanning directory: " << scan.root << std::endl;
        for (const auto &w : scan.warnings) {
            std::cerr << "Warning: " << w << std::endl;
        }

        if (scan.files.empty()) {
            std::cout << "No audio files found in the folder." << std::endl;
            return 0;
        }

        int workers = resolve_worker_count(cfg.pool.num_workers);
        std::cout << "Found " << scan.files.size()
                  << " audio files. Processing with " << workers
                  << " workers...\n"
                  << std::endl;

        // 2. Tally
        std::unique_ptr<ConsoleProgress> bar;
        ProgressFn progress;
        if (cfg.show_progress) {
            bar = std::make_unique<ConsoleProgress>(scan.files.size(),
                                                    std::cout);
            progress = [&bar] { bar->advance(); };
        }

        auto t0 = Clock::now();
        auto result = tally_files(scan.files, cfg, progress);
        auto t1 = Clock::now();

        if (bar) {
            bar->finish();
        }
        std::cout << std::endl;

        // 3. Diagnostics
        if (cfg.verbose) {
            for (const auto &f : result.failures) {
                std::cerr << "  [" << error_kind_name(f.error.kind) << "] "
                          << f.path << ": " << f.error.message << std::endl;
            }
            for (const auto &p : result.mp3_early_stops) {
                std::cerr << "  [mp3] stopped before end of stream: " << p
                          << std::endl;
            }
            std::cerr << "  Elapsed: "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(
                             t1 - t0)
                             .count()
                      << " ms" << std::endl;
        }

        // 4. Report
        std::cout << "\n" << format_report(result.stats);

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
