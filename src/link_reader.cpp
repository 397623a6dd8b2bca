#include "uartrx/link_reader.h"

#include <string>
#include <vector>
#include "uartrx/log.h"

namespace uartrx {

static const char* TAG = "link";

LinkReader::LinkReader(SerialLink& link, uint32_t timeout_ms)
    : link(link), timeout_ms(timeout_ms) {}

bool LinkReader::wait_for_start() {
    uint8_t b = 0;
    while (true) {
        if (link.read(&b, 1, timeout_ms) == 0) {
            return false; // quiet line
        }
        if (b == START_BYTE) {
            return true;
        }
        link_stats.noise_bytes++;
    }
}

ReadResult LinkReader::read_frame(Frame& frame) {
    if (!wait_for_start()) {
        return NO_FRAME;
    }

    uint8_t hdr[HEADER_SIZE];
    size_t n = link.read(hdr, HEADER_SIZE, timeout_ms);
    if (n != HEADER_SIZE) {
        link_stats.partial_headers++;
        log_warn(TAG, "Incomplete header (got " + std::to_string(n) + "/" +
                          std::to_string(HEADER_SIZE) + " bytes)");
        return NO_FRAME;
    }

    uint8_t type = hdr[0];
    uint8_t len = hdr[1];

    // payload + checksum
    std::vector<uint8_t> body((size_t)len + 1);
    n = link.read(body.data(), body.size(), timeout_ms);
    if (n != body.size()) {
        link_stats.partial_bodies++;
        log_warn(TAG, "Incomplete body (expected " + std::to_string(body.size()) + ", got " +
                          std::to_string(n) + ")");
        return NO_FRAME;
    }

    uint8_t received = body.back();
    body.pop_back();

    FrameStatus status = decode_frame(type, len, body, received, frame);
    if (status != FRAME_OK) {
        link_stats.bad_checksums++;
        log_warn(TAG, std::string("Dropped ") + frame_type_name(type) + " frame (type=" +
                          hex_byte(type) + " len=" + std::to_string(len) +
                          "): " + frame_status_name(status));
        return NO_FRAME;
    }

    link_stats.frames++;
    return FRAME_RECEIVED;
}

} // namespace uartrx
