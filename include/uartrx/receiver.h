#ifndef UARTRX_RECEIVER_H
#define UARTRX_RECEIVER_H

#include <cstdint>
#include <vector>
#include "frame.h"
#include "raw_archive.h"
#include "record_store.h"
#include "serial_link.h"
#include "transfer_status.h"

namespace uartrx {

// Host side of the stop-and-wait file transfer.
//
//   IDLE      + START -> ACK -> RECEIVING
//   RECEIVING + DATA  -> append, ACK
//   RECEIVING + START -> drop buffer, re-arm, ACK (sender restarted)
//   RECEIVING + END   -> ACK, verify, store, COMMIT -> IDLE
//
// ACKs go out before any other work; the sender only waits ACK_DEADLINE_MS.
// Anything else is ignored without an ACK. LinkError from a write drops the
// transfer and is rethrown to the caller.
class Receiver {
public:
    enum State {
        IDLE,
        RECEIVING
    };

    Receiver(SerialLink& link, RecordStore& store, RawArchive& archive, TransferStatus& status);

    void handle_frame(const Frame& frame);

    // Drops the transfer in progress, e.g. after the link failed.
    void abort();

    State state() const { return rx_state; }
    uint32_t expected_size() const { return transfer.expected_size; }
    size_t buffered_bytes() const { return transfer.buffer.size(); }
    bool overflowed() const { return transfer.overflow; }

private:
    struct Transfer {
        uint32_t expected_size = 0;
        std::vector<uint8_t> buffer;
        bool overflow = false; // DATA went past expected_size; END must fail
        int64_t started_at_ms = 0;
    };

    SerialLink& link;
    RecordStore& store;
    RawArchive& archive;
    TransferStatus& status;

    State rx_state = IDLE;
    Transfer transfer;

    void on_start(const Frame& frame);
    void on_data(const Frame& frame);
    void on_end();

    bool verify(TransferOutcome& outcome);
    void send_ack();
    void send_commit(uint8_t code);
    void reset_transfer(uint32_t expected_size);

    static int64_t now_ms();
};

const char* receiver_state_name(Receiver::State state);

} // namespace uartrx

#endif // UARTRX_RECEIVER_H
