#include "audiotally/audio_format.hpp"

#include <cctype>

namespace audiotally {

// ─── Format Detection ────────────────────────────────────────────────────────

std::string normalized_extension(const std::string &path) {
    auto dot = path.rfind('.');
    auto slash = path.find_last_of("/\\");
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash))
        return "";

    std::string ext = path.substr(dot);
    for (auto &c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

AudioFormat detect_format_by_extension(const std::string &path) {
    std::string ext = normalized_extension(path);

    if (ext == ".wav")
        return AudioFormat::WAV;
    if (ext == ".flac")
        return AudioFormat::FLAC;
    if (ext == ".mp3")
        return AudioFormat::MP3;
    if (ext == ".ogg")
        return AudioFormat::OGG;
    if (ext == ".m4a")
        return AudioFormat::M4A;
    return AudioFormat::Unknown;
}

bool is_audio_extension(const std::string &path) {
    return detect_format_by_extension(path) != AudioFormat::Unknown;
}

bool has_duration_parser(AudioFormat fmt) {
    return fmt == AudioFormat::MP3 || fmt == AudioFormat::WAV ||
           fmt == AudioFormat::M4A;
}

const char *format_name(AudioFormat fmt) {
    switch (fmt) {
    case AudioFormat::WAV:
        return "WAV";
    case AudioFormat::FLAC:
        return "FLAC";
    case AudioFormat::MP3:
        return "MP3";
    case AudioFormat::OGG:
        return "OGG";
    case AudioFormat::M4A:
        return "M4A";
    default:
        return "Unknown";
    }
}

} // namespace audiotally
