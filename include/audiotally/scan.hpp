#pragma once

#include <string>
#include <vector>

namespace audiotally {

struct ScanResult {
    std::string root;                  // root after symlink resolution
    std::vector<std::string> files;    // discovery order
    std::vector<std::string> warnings; // entries that were skipped
};

// Resolve symlinks in `root`, then walk the tree depth-first with entries in
// lexical order, collecting regular files with an audio extension. Directory
// symlinks below the root are not followed.
//
// Unreadable entries are skipped and reported in `warnings`. Throws
// std::runtime_error when the root cannot be resolved or enumerated.
ScanResult collect_audio_files(const std::string &root);

} // namespace audiotally
