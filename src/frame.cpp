#include "uartrx/frame.h"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace uartrx {

// ─────────────────── Checksum ───────────────────

uint8_t xor_checksum(uint8_t type, uint8_t len, const uint8_t* payload, size_t size) {
    uint8_t c = type ^ len;
    for (size_t i = 0; i < size; i++) {
        c ^= payload[i];
    }
    return c;
}

// ─────────────────── Builders ───────────────────

std::vector<uint8_t> encode_frame(uint8_t type, const std::vector<uint8_t>& payload) {
    if (payload.size() > MAX_PAYLOAD) {
        throw std::length_error("frame payload of " + std::to_string(payload.size()) +
                                " bytes exceeds " + std::to_string(MAX_PAYLOAD));
    }
    uint8_t len = (uint8_t)payload.size();

    std::vector<uint8_t> pkt;
    pkt.reserve(1 + HEADER_SIZE + payload.size() + 1);
    pkt.push_back(START_BYTE);
    pkt.push_back(type);
    pkt.push_back(len);
    pkt.insert(pkt.end(), payload.begin(), payload.end());
    pkt.push_back(xor_checksum(type, len, payload.data(), payload.size()));
    return pkt;
}

std::vector<uint8_t> build_ack() {
    return encode_frame(TYPE_ACK, std::vector<uint8_t>());
}

std::vector<uint8_t> build_commit(uint8_t status) {
    return encode_frame(TYPE_COMMIT, std::vector<uint8_t>(1, status));
}

std::vector<uint8_t> start_payload(uint32_t size) {
    std::vector<uint8_t> p(START_PAYLOAD_SIZE);
    for (size_t i = 0; i < START_PAYLOAD_SIZE; i++) {
        p[i] = (size >> (8 * i)) & 0xFF;
    }
    return p;
}

// ─────────────────── Parsers ───────────────────

FrameStatus decode_frame(uint8_t type, uint8_t len, const std::vector<uint8_t>& payload,
                         uint8_t checksum, Frame& out) {
    if (payload.size() != len) {
        return FRAME_BAD_LENGTH;
    }
    if (xor_checksum(type, len, payload.data(), payload.size()) != checksum) {
        return FRAME_BAD_CHECKSUM;
    }
    out.type = type;
    out.payload = payload;
    return FRAME_OK;
}

bool parse_start_size(const std::vector<uint8_t>& payload, uint32_t& size) {
    if (payload.size() < START_PAYLOAD_SIZE) {
        return false;
    }
    size = (uint32_t)payload[0] | ((uint32_t)payload[1] << 8) |
           ((uint32_t)payload[2] << 16) | ((uint32_t)payload[3] << 24);
    return true;
}

const char* frame_type_name(uint8_t type) {
    switch (type) {
    case TYPE_START:
        return "START";
    case TYPE_DATA:
        return "DATA";
    case TYPE_END:
        return "END";
    case TYPE_ACK:
        return "ACK";
    case TYPE_COMMIT:
        return "COMMIT";
    default:
        return "UNKNOWN";
    }
}

std::string hex_byte(uint8_t b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", b);
    return buf;
}

const char* frame_status_name(FrameStatus status) {
    switch (status) {
    case FRAME_OK:
        return "ok";
    case FRAME_BAD_LENGTH:
        return "bad length";
    case FRAME_BAD_CHECKSUM:
        return "checksum mismatch";
    }
    return "unknown";
}

} // namespace uartrx
