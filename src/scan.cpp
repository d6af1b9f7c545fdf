#include "audiotally/scan.hpp"

#include "audiotally/audio_format.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace audiotally {

namespace fs = std::filesystem;

namespace {

void add_warning(ScanResult &out, const fs::path &p, const std::error_code &ec) {
    out.warnings.push_back("skipping " + p.string() + ": " + ec.message());
}

// Regular files, and symlinks that resolve to regular files.
bool is_file_entry(const fs::directory_entry &e, fs::file_status st,
                   ScanResult &out) {
    if (fs::is_regular_file(st))
        return true;
    if (!fs::is_symlink(st))
        return false;

    std::error_code ec;
    auto target = e.status(ec);
    if (ec) {
        add_warning(out, e.path(), ec);
        return false;
    }
    return fs::is_regular_file(target);
}

void walk(const fs::path &dir, ScanResult &out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        add_warning(out, dir, ec);
        return;
    }

    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            add_warning(out, dir, ec);
            break;
        }
        entries.push_back(*it);
    }

    // Lexical order within each directory, depth-first
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto &e : entries) {
        std::error_code sec;
        auto st = e.symlink_status(sec);
        if (sec) {
            add_warning(out, e.path(), sec);
            continue;
        }

        if (fs::is_directory(st)) {
            walk(e.path(), out);
            continue;
        }

        if (is_audio_extension(e.path().string()) &&
            is_file_entry(e, st, out)) {
            out.files.push_back(e.path().string());
        }
    }
}

} // namespace

ScanResult collect_audio_files(const std::string &root) {
    ScanResult out;

    std::error_code ec;
    auto resolved = fs::canonical(root, ec);
    if (ec) {
        throw std::runtime_error("Error resolving path: " + root + ": " +
                                 ec.message());
    }
    out.root = resolved.string();

    auto st = fs::status(resolved, ec);
    if (ec) {
        throw std::runtime_error("Error reading directory: " + out.root +
                                 ": " + ec.message());
    }

    // A single file given as the root is its own one-entry tree.
    if (!fs::is_directory(st)) {
        if (fs::is_regular_file(st) && is_audio_extension(out.root))
            out.files.push_back(out.root);
        return out;
    }

    fs::directory_iterator probe(resolved, ec);
    if (ec) {
        throw std::runtime_error("Error reading directory: " + out.root +
                                 ": " + ec.message());
    }

    walk(resolved, out);
    return out;
}

} // namespace audiotally
