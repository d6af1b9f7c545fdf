#pragma once

#include <stdexcept>
#include <string>

namespace audiotally {

// ─── Per-File Error Taxonomy ─────────────────────────────────────────────────

enum class ErrorKind {
    UnsupportedFormat, // extension not recognized at all
    NotImplemented,    // recognized extension without a parser (ogg, flac)
    FileAccess,        // open / read failure
    Malformed,         // header or box structure did not match
};

const char *error_kind_name(ErrorKind kind);

// Thrown by the duration parsers. The dispatcher converts it into a FileError
// so it never crosses a worker boundary.
class DurationError : public std::runtime_error {
  public:
    DurationError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
};

struct FileError {
    ErrorKind kind;
    std::string message;
};

} // namespace audiotally
