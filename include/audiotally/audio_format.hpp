#pragma once

#include <string>

namespace audiotally {

enum class AudioFormat { Unknown, WAV, FLAC, MP3, OGG, M4A };

// Lower-cased extension including the dot (".mp3"), or "" if there is none.
std::string normalized_extension(const std::string &path);

AudioFormat detect_format_by_extension(const std::string &path);

// True for the five extensions discovery collects: mp3, wav, ogg, flac, m4a.
bool is_audio_extension(const std::string &path);

// Formats with a duration parser. OGG and FLAC are recognized but not
// implemented.
bool has_duration_parser(AudioFormat fmt);

const char *format_name(AudioFormat fmt);

} // namespace audiotally
