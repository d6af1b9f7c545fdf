#include "audiotally/duration.hpp"

#include "audiotally/m4a.hpp"
#include "audiotally/mp3.hpp"
#include "audiotally/wav.hpp"

#include <ios>

namespace audiotally {

// ─── Dispatch ───────────────────────────────────────────────────────────────

namespace {

DurationOutcome dispatch(const std::string &path) {
    DurationOutcome out;
    auto fmt = detect_format_by_extension(path);

    switch (fmt) {
    case AudioFormat::MP3: {
        auto scan = scan_mp3(path);
        out.seconds = scan.seconds;
        out.mp3_stop = scan.stop;
        return out;
    }
    case AudioFormat::WAV:
        out.seconds = get_wav_duration(path);
        return out;
    case AudioFormat::M4A:
        out.seconds = get_m4a_duration(path);
        return out;
    case AudioFormat::OGG:
    case AudioFormat::FLAC:
        throw DurationError(ErrorKind::NotImplemented,
                            "format recognized but not implemented: " +
                                normalized_extension(path));
    default:
        throw DurationError(ErrorKind::UnsupportedFormat,
                            "unsupported format: " +
                                normalized_extension(path));
    }
}

} // namespace

DurationOutcome resolve_duration(const std::string &path) {
    try {
        return dispatch(path);
    } catch (const DurationError &e) {
        DurationOutcome out;
        out.error = FileError{e.kind(), e.what()};
        return out;
    } catch (const std::ios_base::failure &e) {
        DurationOutcome out;
        out.error = FileError{ErrorKind::FileAccess, e.what()};
        return out;
    } catch (const std::exception &e) {
        DurationOutcome out;
        out.error = FileError{ErrorKind::Malformed, e.what()};
        return out;
    }
}

} // namespace audiotally
