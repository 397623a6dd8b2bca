#ifndef UARTRX_FRAME_H
#define UARTRX_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "constants.h"

namespace uartrx {

struct Frame {
    uint8_t type = 0;
    std::vector<uint8_t> payload;
};

enum FrameStatus {
    FRAME_OK,
    FRAME_BAD_LENGTH,   // payload size differs from the declared length
    FRAME_BAD_CHECKSUM
};

// XOR of type, len and every payload byte. The start byte is not covered.
uint8_t xor_checksum(uint8_t type, uint8_t len, const uint8_t* payload, size_t size);

// Builds [START_BYTE][type][len][payload...][checksum].
// Throws std::length_error if the payload is longer than MAX_PAYLOAD.
std::vector<uint8_t> encode_frame(uint8_t type, const std::vector<uint8_t>& payload);

// Checks a received frame body against its checksum and fills `out` on success.
FrameStatus decode_frame(uint8_t type, uint8_t len, const std::vector<uint8_t>& payload,
                         uint8_t checksum, Frame& out);

std::vector<uint8_t> build_ack();
std::vector<uint8_t> build_commit(uint8_t status);

// Reads the little-endian u32 file size of a START payload.
bool parse_start_size(const std::vector<uint8_t>& payload, uint32_t& size);
std::vector<uint8_t> start_payload(uint32_t size);

const char* frame_type_name(uint8_t type);
std::string hex_byte(uint8_t b); // "0x0A"
const char* frame_status_name(FrameStatus status);

} // namespace uartrx

#endif // UARTRX_FRAME_H
