#ifndef UARTRX_LINK_READER_H
#define UARTRX_LINK_READER_H

#include <cstdint>
#include "constants.h"
#include "frame.h"
#include "serial_link.h"

namespace uartrx {

enum ReadResult {
    FRAME_RECEIVED,
    NO_FRAME // timeout or a frame that was dropped; not an error
};

struct LinkStats {
    uint64_t frames = 0;
    uint64_t noise_bytes = 0;      // bytes skipped while hunting for START_BYTE
    uint64_t partial_headers = 0;
    uint64_t partial_bodies = 0;
    uint64_t bad_checksums = 0;
};

// Pulls validated frames out of a noisy byte stream.
class LinkReader {
public:
    explicit LinkReader(SerialLink& link, uint32_t timeout_ms = READ_TIMEOUT_MS);

    // Resynchronizes on the next START_BYTE and reads one frame.
    // Throws LinkError if the link itself fails.
    ReadResult read_frame(Frame& frame);

    const LinkStats& stats() const { return link_stats; }

private:
    SerialLink& link;
    uint32_t timeout_ms;
    LinkStats link_stats;

    bool wait_for_start();
};

} // namespace uartrx

#endif // UARTRX_LINK_READER_H
