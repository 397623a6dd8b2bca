#ifndef UARTRX_CONSTANTS_H
#define UARTRX_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace uartrx {

// Frame: [START_BYTE][TYPE][LEN][PAYLOAD...][CHECKSUM]
constexpr uint8_t START_BYTE = 0xAA;
constexpr size_t HEADER_SIZE = 2;     // type + len, after the start byte
constexpr size_t MAX_PAYLOAD = 255;

constexpr uint8_t TYPE_START = 0x01;  // sender -> host, payload = file size (u32 LE)
constexpr uint8_t TYPE_DATA = 0x02;   // sender -> host, payload = 1..255 file bytes
constexpr uint8_t TYPE_END = 0x03;    // sender -> host, no payload
constexpr uint8_t TYPE_ACK = 0x04;    // host -> sender, no payload
constexpr uint8_t TYPE_COMMIT = 0x05; // host -> sender, payload = 1 status byte

constexpr size_t START_PAYLOAD_SIZE = 4;

constexpr uint8_t COMMIT_OK = 0x00;
constexpr uint8_t COMMIT_FAIL = 0x01;

// Sender-side timing the host has to fit into.
constexpr uint32_t ACK_DEADLINE_MS = 500;
constexpr uint32_t COMMIT_DEADLINE_MS = 2000;

constexpr uint32_t READ_TIMEOUT_MS = 1000;
constexpr uint32_t WRITE_TIMEOUT_MS = ACK_DEADLINE_MS; // a later ACK is useless to the sender
constexpr uint32_t RECONNECT_BACKOFF_MS = 3000;

// GPS log rows: utc_time,latitude,longitude,fix_quality,num_satellites,hdop,altitude,geoid_height
constexpr size_t GPS_MIN_FIELDS = 3;

} // namespace uartrx

#endif // UARTRX_CONSTANTS_H
