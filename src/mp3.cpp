// MP3 duration by walking MPEG audio frames.
//
// Uses the low-level frame decoder of dr_mp3 (mackron/dr_libs). Passing a
// null PCM buffer makes drmp3dec_decode_frame locate and validate the next
// frame header without running synthesis, so the walk costs one header
// parse per frame.

#define DR_MP3_IMPLEMENTATION
#include "dr_mp3.h"

#include "audiotally/errors.hpp"
#include "audiotally/mp3.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <vector>

namespace audiotally {

namespace {

constexpr size_t BUFFER_SIZE = 16 * 1024;
// Keep at least this much buffered so the decoder can check the following
// frame headers when it syncs.
constexpr size_t REFILL_BELOW = BUFFER_SIZE / 2;

constexpr size_t ID3V2_HEADER_SIZE = 10;
constexpr size_t ID3V1_TAG_SIZE = 128;

// Total size of an ID3v2 tag (header + body + optional footer) at the start
// of the stream, or 0 if the bytes are not an ID3v2 header.
uint64_t id3v2_tag_size(const uint8_t *h, size_t len) {
    if (len < ID3V2_HEADER_SIZE || h[0] != 'I' || h[1] != 'D' || h[2] != '3')
        return 0;
    if (h[3] == 0xFF || h[4] == 0xFF)
        return 0;
    // Size is a 28-bit synchsafe integer
    if ((h[6] | h[7] | h[8] | h[9]) & 0x80)
        return 0;

    uint64_t size = (static_cast<uint64_t>(h[6]) << 21) |
                    (static_cast<uint64_t>(h[7]) << 14) |
                    (static_cast<uint64_t>(h[8]) << 7) |
                    static_cast<uint64_t>(h[9]);
    size += ID3V2_HEADER_SIZE;
    if (h[5] & 0x10)
        size += ID3V2_HEADER_SIZE; // footer
    return size;
}

// PCM samples per channel in one frame.
int samples_per_frame(const drmp3dec_frame_info &info) {
    if (info.layer == 1)
        return 384;
    // MPEG-2 and 2.5 Layer III frames are half-length; their sample rates
    // are all below 32 kHz.
    if (info.layer == 3 && info.hz < 32000)
        return 576;
    return 1152;
}

// ─── Frame Header ───────────────────────────────────────────────────────────

constexpr size_t FRAME_HEADER_SIZE = 4;

// kbps by [MPEG1, MPEG2/2.5][layer 1..3][bitrate index]
const uint16_t BITRATE_KBPS[2][3][16] = {
    {
        {0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448, 0},
        {0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384, 0},
        {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 0},
    },
    {
        {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256, 0},
        {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0},
        {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0},
    },
};

// Hz by [version bits][sample rate index]
const uint32_t SAMPLE_RATE_HZ[4][3] = {
    {11025, 12000, 8000},  // MPEG-2.5
    {0, 0, 0},             // reserved
    {22050, 24000, 16000}, // MPEG-2
    {44100, 48000, 32000}, // MPEG-1
};

// Byte length of the frame whose header starts at `h`, padding included.
// 0 for invalid and free-format headers.
size_t frame_length(const uint8_t *h) {
    if (h[0] != 0xFF || (h[1] & 0xE0) != 0xE0)
        return 0;

    int version = (h[1] >> 3) & 3;
    int layer = 4 - ((h[1] >> 1) & 3); // 4 means reserved
    int bitrate_idx = (h[2] >> 4) & 0xF;
    int rate_idx = (h[2] >> 2) & 3;
    int padding = (h[2] >> 1) & 1;
    if (version == 1 || layer == 4 || bitrate_idx == 0 || bitrate_idx == 15 ||
        rate_idx == 3)
        return 0;

    uint32_t bitrate =
        BITRATE_KBPS[version == 3 ? 0 : 1][layer - 1][bitrate_idx] * 1000u;
    uint32_t hz = SAMPLE_RATE_HZ[version][rate_idx];

    if (layer == 1)
        return (12 * bitrate / hz + padding) * 4;
    uint32_t slots = (layer == 3 && version != 3) ? 72 : 144;
    return slots * bitrate / hz + padding;
}

// Same MPEG version, layer and sample rate as `prev`.
bool same_stream(const uint8_t *h, const uint8_t *prev) {
    return h[0] == 0xFF && ((h[1] ^ prev[1]) & 0xFE) == 0 &&
           ((h[2] ^ prev[2]) & 0x0C) == 0;
}

// Sliding read window over [begin, end) of the file.
class ByteWindow {
  public:
    ByteWindow(std::ifstream &file, const std::string &path, uint64_t length)
        : file_(file), path_(path), left_(length), buf_(BUFFER_SIZE) {}

    const uint8_t *data() const { return buf_.data() + head_; }
    size_t available() const { return tail_ - head_; }
    bool exhausted() const { return left_ == 0; }

    void consume(size_t n) { head_ += std::min(n, available()); }

    void refill() {
        if (left_ == 0 || available() >= REFILL_BELOW)
            return;

        if (head_ > 0) {
            std::memmove(buf_.data(), buf_.data() + head_, available());
            tail_ -= head_;
            head_ = 0;
        }

        size_t want = static_cast<size_t>(
            std::min<uint64_t>(buf_.size() - tail_, left_));
        file_.read(reinterpret_cast<char *>(buf_.data() + tail_),
                   static_cast<std::streamsize>(want));
        if (file_.bad()) {
            throw DurationError(ErrorKind::FileAccess,
                                "Read error in MP3 file: " + path_);
        }

        size_t got = static_cast<size_t>(file_.gcount());
        tail_ += got;
        // A short read means the file shrank underneath us; treat it as the
        // end of the stream.
        left_ = (got < want) ? 0 : left_ - got;
    }

  private:
    std::ifstream &file_;
    const std::string &path_;
    uint64_t left_; // bytes of the audio region not yet read
    std::vector<uint8_t> buf_;
    size_t head_ = 0;
    size_t tail_ = 0;
};

} // namespace

Mp3Scan scan_mp3(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DurationError(ErrorKind::FileAccess,
                            "Cannot open MP3 file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto end_pos = file.tellg();
    if (end_pos < 0) {
        throw DurationError(ErrorKind::FileAccess,
                            "Cannot determine size of MP3 file: " + path);
    }
    uint64_t file_size = static_cast<uint64_t>(end_pos);

    // Locate the audio region: skip a leading ID3v2 tag and drop a trailing
    // ID3v1 tag.
    uint64_t audio_begin = 0;
    uint64_t audio_end = file_size;

    uint8_t head[ID3V2_HEADER_SIZE] = {};
    file.seekg(0);
    file.read(reinterpret_cast<char *>(head), sizeof(head));
    audio_begin = std::min(
        id3v2_tag_size(head, static_cast<size_t>(file.gcount())), file_size);
    file.clear();

    if (audio_end - audio_begin >= ID3V1_TAG_SIZE) {
        char tag[3] = {};
        file.seekg(static_cast<std::streamoff>(audio_end - ID3V1_TAG_SIZE));
        file.read(tag, sizeof(tag));
        if (file.gcount() == 3 && std::memcmp(tag, "TAG", 3) == 0)
            audio_end -= ID3V1_TAG_SIZE;
        file.clear();
    }

    file.seekg(static_cast<std::streamoff>(audio_begin));
    if (!file) {
        throw DurationError(ErrorKind::FileAccess,
                            "Cannot seek in MP3 file: " + path);
    }

    drmp3dec dec;
    drmp3dec_init(&dec);

    ByteWindow window(file, path, audio_end - audio_begin);
    Mp3Scan scan;
    uint8_t last_header[FRAME_HEADER_SIZE] = {};

    for (;;) {
        window.refill();
        size_t avail = window.available();
        if (avail == 0) {
            scan.stop = Mp3Stop::EndOfStream;
            break;
        }

        drmp3dec_frame_info info{};
        drmp3dec_decode_frame(&dec, window.data(), static_cast<int>(avail),
                              nullptr, &info);

        // The decoder accepts a frame only when the next header follows it
        // or when the frame fills the buffer exactly. The last frame before
        // a trailing tag or junk fails both checks; offer it on its own.
        if ((info.hz <= 0 || info.frame_bytes <= 0) && scan.frames > 0 &&
            avail >= FRAME_HEADER_SIZE &&
            same_stream(window.data(), last_header)) {
            size_t len = frame_length(window.data());
            if (len > 0 && len < avail) {
                info = drmp3dec_frame_info{};
                drmp3dec_decode_frame(&dec, window.data(),
                                      static_cast<int>(len), nullptr, &info);
            }
        }

        // hz is only filled in when a frame header was located. Anything
        // else is the first decode error, which ends the walk.
        if (info.hz <= 0 || info.frame_bytes <= 0) {
            scan.stop = Mp3Stop::StoppedEarly;
            break;
        }
        std::memcpy(last_header, dec.header, FRAME_HEADER_SIZE);

        scan.seconds += static_cast<double>(samples_per_frame(info)) /
                        static_cast<double>(info.hz);
        scan.frames++;
        window.consume(static_cast<size_t>(info.frame_bytes));
    }

    return scan;
}

} // namespace audiotally
