#include "audiotally/errors.hpp"

namespace audiotally {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnsupportedFormat:
        return "unsupported format";
    case ErrorKind::NotImplemented:
        return "not implemented";
    case ErrorKind::FileAccess:
        return "file access";
    case ErrorKind::Malformed:
        return "malformed";
    }
    return "unknown";
}

} // namespace audiotally
