#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace audiotally {

// ─── Movie Header ────────────────────────────────────────────────────────────

struct MovieHeader {
    uint8_t version = 0;
    uint32_t time_scale = 0;
    uint64_t duration = 0; // in time_scale units

    double seconds() const {
        return time_scale > 0 ? static_cast<double>(duration) /
                                    static_cast<double>(time_scale)
                              : 0.0;
    }
};

// Decode an mvhd body (bytes after the 8-byte box header).
// Version 0: time scale at offset 12, 32-bit duration at 16.
// Version 1: time scale at offset 20, 64-bit duration at 24.
// Returns false when the body is too short or the version is unknown.
bool parse_mvhd(const uint8_t *body, size_t len, MovieHeader &out);

// ─── Box Walker ──────────────────────────────────────────────────────────────

// True for ISO-BMFF boxes whose payload is a sequence of child boxes and that
// can lead to an mvhd (moov, trak, mdia, ...).
bool is_container_box(const char type[4]);

// Duration of an M4A/MP4 file from its movie header.
//
// The box tree is walked with an explicit stack, descending into container
// boxes and skipping everything else. The walk stops at the first mvhd, at a
// zero-sized box, or at any box whose size is inconsistent with its parent.
//
// Throws DurationError:
//   FileAccess - the file cannot be opened
//   Malformed  - "could not parse M4A duration" (no usable mvhd)
double get_m4a_duration(const std::string &path);

} // namespace audiotally
