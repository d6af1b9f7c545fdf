#pragma once

#include <string>

namespace audiotally {

// Duration of a RIFF/WAVE file from its header: data chunk length divided by
// (sample_rate * block_align). Samples are never read.
//
// Throws DurationError:
//   FileAccess - the file cannot be opened
//   Malformed  - "invalid WAV file", or a header without a usable sample rate
double get_wav_duration(const std::string &path);

} // namespace audiotally
