#pragma once

#include <optional>
#include <string>

#include "audiotally/audio_format.hpp"
#include "audiotally/errors.hpp"
#include "audiotally/mp3.hpp"

namespace audiotally {

// ─── Dispatch Outcome ───────────────────────────────────────────────────────

struct DurationOutcome {
    double seconds = 0.0;
    std::optional<FileError> error;
    std::optional<Mp3Stop> mp3_stop; // set for MP3 files only

    bool ok() const { return !error.has_value(); }
};

/// Resolve the playback duration of one file.
///
/// Routes on the case-insensitive extension: .mp3, .wav and .m4a go to their
/// parsers; .ogg and .flac report ErrorKind::NotImplemented; anything else
/// reports ErrorKind::UnsupportedFormat. Never throws for per-file problems:
/// every parser failure is returned in `error`.
DurationOutcome resolve_duration(const std::string &path);

} // namespace audiotally
