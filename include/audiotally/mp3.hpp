#pragma once

#include <cstdint>
#include <string>

namespace audiotally {

// How the frame walk ended. Both are successful completions.
enum class Mp3Stop {
    EndOfStream,  // every byte of the audio region was consumed by frames
    StoppedEarly, // undecodable bytes remained after the last frame
};

struct Mp3Scan {
    double seconds = 0.0;
    int64_t frames = 0;
    Mp3Stop stop = Mp3Stop::EndOfStream;
};

// Sum the durations of all MPEG audio frames in the file, stopping at the
// first point where no further frame can be decoded. Only frame headers are
// parsed; no PCM is synthesized.
//
// A leading ID3v2 tag and a trailing ID3v1 tag are excluded from the walk.
// Zero decodable frames is not an error (seconds == 0). Throws DurationError
// (FileAccess) only when the file cannot be opened or read.
Mp3Scan scan_mp3(const std::string &path);

inline double get_mp3_duration(const std::string &path) {
    return scan_mp3(path).seconds;
}

} // namespace audiotally
