#include "audiotally/m4a.hpp"

#include "audiotally/errors.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <vector>

namespace audiotally {

namespace {

constexpr uint64_t BOX_HEADER_SIZE = 8;
constexpr uint64_t LARGE_BOX_HEADER_SIZE = 16; // size == 1, 64-bit size follows

// An mvhd body is 100 bytes (v0) or 112 bytes (v1); never read more than
// this no matter what the size field says.
constexpr uint64_t MAX_MVHD_BODY = 4096;

uint32_t read_be32(const uint8_t *p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t read_be64(const uint8_t *p) {
    return (static_cast<uint64_t>(read_be32(p)) << 32) | read_be32(p + 4);
}

} // namespace

// ─── Movie Header ────────────────────────────────────────────────────────────

bool parse_mvhd(const uint8_t *body, size_t len, MovieHeader &out) {
    if (len < 1)
        return false;

    uint8_t version = body[0];
    if (version == 0) {
        if (len < 20)
            return false;
        out.time_scale = read_be32(body + 12);
        out.duration = read_be32(body + 16);
    } else if (version == 1) {
        if (len < 32)
            return false;
        out.time_scale = read_be32(body + 20);
        out.duration = read_be64(body + 24);
    } else {
        return false;
    }
    out.version = version;
    return true;
}

// ─── Box Walker ──────────────────────────────────────────────────────────────

bool is_container_box(const char type[4]) {
    static const char *const CONTAINERS[] = {
        "moov", "trak", "mdia", "minf", "stbl", "edts",
        "dinf", "mvex", "udta", "moof", "traf",
    };
    for (const char *c : CONTAINERS) {
        if (std::memcmp(type, c, 4) == 0)
            return true;
    }
    return false;
}

double get_m4a_duration(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DurationError(ErrorKind::FileAccess,
                            "Cannot open M4A file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto end_pos = file.tellg();
    if (end_pos < 0) {
        throw DurationError(ErrorKind::FileAccess,
                            "Cannot determine size of M4A file: " + path);
    }
    const uint64_t file_size = static_cast<uint64_t>(end_pos);

    // End offsets of the containers we are inside; the file is the outermost.
    std::vector<uint64_t> ends{file_size};
    uint64_t pos = 0;
    double seconds = 0.0;

    while (!ends.empty() && pos < file_size) {
        uint64_t limit = ends.back();
        if (pos >= limit) {
            ends.pop_back();
            continue;
        }
        if (limit - pos < BOX_HEADER_SIZE) {
            // Padding at the tail of a container
            pos = limit;
            continue;
        }

        uint8_t hdr[LARGE_BOX_HEADER_SIZE];
        file.seekg(static_cast<std::streamoff>(pos));
        file.read(reinterpret_cast<char *>(hdr), BOX_HEADER_SIZE);
        if (file.gcount() < static_cast<std::streamsize>(BOX_HEADER_SIZE))
            break;

        uint64_t size = read_be32(hdr);
        uint64_t header_size = BOX_HEADER_SIZE;
        char type[4];
        std::memcpy(type, hdr + 4, 4);

        if (size == 1) {
            file.read(reinterpret_cast<char *>(hdr + BOX_HEADER_SIZE), 8);
            if (file.gcount() < 8)
                break;
            size = read_be64(hdr + BOX_HEADER_SIZE);
            header_size = LARGE_BOX_HEADER_SIZE;
        }

        if (size == 0)
            break; // terminal sentinel
        if (size < header_size)
            break; // malformed

        // A box running past its parent is truncated; clamp it.
        uint64_t box_end = pos + std::min(size, limit - pos);
        if (box_end - pos < header_size)
            break; // header itself runs past the parent

        if (std::memcmp(type, "mvhd", 4) == 0) {
            uint64_t body_len =
                std::min(box_end - pos - header_size, MAX_MVHD_BODY);
            std::vector<uint8_t> body(static_cast<size_t>(body_len));
            file.read(reinterpret_cast<char *>(body.data()),
                      static_cast<std::streamsize>(body_len));
            size_t got = static_cast<size_t>(file.gcount());

            MovieHeader mvhd;
            if (parse_mvhd(body.data(), got, mvhd))
                seconds = mvhd.seconds();
            break; // mvhd is unique and authoritative
        }

        if (is_container_box(type) && box_end - pos > header_size) {
            ends.push_back(box_end);
            pos += header_size;
        } else {
            pos = box_end;
        }
    }

    if (file.bad()) {
        throw DurationError(ErrorKind::FileAccess,
                            "Read error in M4A file: " + path);
    }

    if (seconds == 0.0) {
        throw DurationError(ErrorKind::Malformed,
                            "could not parse M4A duration");
    }
    return seconds;
}

} // namespace audiotally
