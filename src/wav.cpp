// WAV duration from the RIFF header.
//
// Uses the single-header dr_wav decoder (mackron/dr_libs). Only the header
// and chunk table are parsed; the frame count comes from the data (or fact)
// chunk size and the block alignment declared in fmt.

#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

#include "audiotally/errors.hpp"
#include "audiotally/wav.hpp"

#include <fstream>

namespace audiotally {

double get_wav_duration(const std::string &path) {
    // dr_wav reports open failures and bad headers the same way, so check
    // that the file is readable first.
    {
        std::ifstream probe(path, std::ios::binary);
        if (!probe) {
            throw DurationError(ErrorKind::FileAccess,
                                "Cannot open WAV file: " + path);
        }
    }

    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        throw DurationError(ErrorKind::Malformed, "invalid WAV file");
    }

    drwav_uint64 total_frames = wav.totalPCMFrameCount;
    drwav_uint32 sample_rate = wav.sampleRate;
    drwav_uninit(&wav);

    if (sample_rate == 0) {
        throw DurationError(ErrorKind::Malformed,
                            "WAV header declares a zero sample rate: " + path);
    }

    return static_cast<double>(total_frames) /
           static_cast<double>(sample_rate);
}

} // namespace audiotally
