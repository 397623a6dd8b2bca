#include "uartrx/receiver.h"

#include <algorithm>
#include <chrono>
#include <string>
#include "uartrx/constants.h"
#include "uartrx/log.h"
#include "uartrx/record_parser.h"

namespace uartrx {

static const char* TAG = "uart_rx";

// A noisy START can declare gigabytes; grow past this only as DATA arrives.
static const size_t MAX_RESERVE_BYTES = 1 << 20;

int64_t Receiver::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

Receiver::Receiver(SerialLink& link, RecordStore& store, RawArchive& archive,
                   TransferStatus& status)
    : link(link), store(store), archive(archive), status(status) {}

const char* receiver_state_name(Receiver::State state) {
    return state == Receiver::RECEIVING ? "RECEIVING" : "IDLE";
}

// ─────────────────── Dispatch ───────────────────

void Receiver::handle_frame(const Frame& frame) {
    try {
        if (rx_state == IDLE) {
            if (frame.type == TYPE_START) {
                on_start(frame);
            } else {
                log_debug(TAG, std::string("Ignoring ") + frame_type_name(frame.type) + " frame (idle)");
            }
            return;
        }

        switch (frame.type) {
        case TYPE_DATA:
            on_data(frame);
            break;
        case TYPE_END:
            on_end();
            break;
        case TYPE_START:
            log_warn(TAG, "Got new START during transfer, restarting");
            on_start(frame);
            break;
        default:
            // No ACK: the sender's retry timer takes care of it.
            log_warn(TAG, "Unexpected packet type " + hex_byte(frame.type) + " during transfer");
            break;
        }
    } catch (const LinkError&) {
        abort();
        throw;
    }
}

void Receiver::abort() {
    if (rx_state == RECEIVING) {
        log_warn(TAG, "Transfer aborted with " + std::to_string(transfer.buffer.size()) + " / " +
                          std::to_string(transfer.expected_size) + " bytes");
    }
    rx_state = IDLE;
    transfer = Transfer();
    status.set_active(false);
}

// ─────────────────── Frame handlers ───────────────────

void Receiver::on_start(const Frame& frame) {
    uint32_t size = 0;
    if (!parse_start_size(frame.payload, size)) {
        if (rx_state == IDLE) {
            log_warn(TAG, "START missing fileSize payload, ignoring");
            return;
        }
        // Restart without a usable size: keep the size we were given before.
        size = transfer.expected_size;
    }

    send_ack();

    reset_transfer(size);
    if (rx_state == IDLE) {
        rx_state = RECEIVING;
        status.set_active(true);
    }
    log_info(TAG, "TRANSFER START (expecting " + std::to_string(size) + " bytes)");
}

void Receiver::on_data(const Frame& frame) {
    size_t room = transfer.expected_size - std::min<size_t>(transfer.buffer.size(),
                                                            transfer.expected_size);
    size_t take = std::min(room, frame.payload.size());
    transfer.buffer.insert(transfer.buffer.end(), frame.payload.begin(),
                           frame.payload.begin() + take);

    if (take < frame.payload.size() && !transfer.overflow) {
        transfer.overflow = true;
        log_warn(TAG, "DATA overruns declared size " + std::to_string(transfer.expected_size) +
                          ", transfer will fail");
    }

    send_ack();
    log_debug(TAG, "DATA +" + std::to_string(frame.payload.size()) + " bytes (" +
                       std::to_string(transfer.buffer.size()) + " / " +
                       std::to_string(transfer.expected_size) + ")");
}

void Receiver::on_end() {
    send_ack();
    int64_t end_at = now_ms();
    log_info(TAG, "END received (" + std::to_string(transfer.buffer.size()) + " / " +
                      std::to_string(transfer.expected_size) + " bytes in " +
                      std::to_string(end_at - transfer.started_at_ms) + " ms)");

    TransferOutcome outcome;
    outcome.bytes_received = transfer.buffer.size();
    outcome.expected_size = transfer.expected_size;
    outcome.success = verify(outcome);

    rx_state = IDLE;
    transfer = Transfer();

    try {
        send_commit(outcome.success ? COMMIT_OK : COMMIT_FAIL);
    } catch (const LinkError&) {
        outcome.commit_latency_ms = now_ms() - end_at;
        outcome.completed_at = std::chrono::system_clock::now();
        status.record_outcome(outcome);
        throw;
    }

    outcome.commit_latency_ms = now_ms() - end_at;
    outcome.completed_at = std::chrono::system_clock::now();
    if (outcome.commit_latency_ms > COMMIT_DEADLINE_MS) {
        log_warn(TAG, "COMMIT took " + std::to_string(outcome.commit_latency_ms) +
                          " ms, sender waits only " + std::to_string(COMMIT_DEADLINE_MS) + " ms");
    }
    status.record_outcome(outcome);

    if (outcome.success) {
        log_info(TAG, "TRANSFER COMPLETE (" + std::to_string(outcome.records_inserted) + " GPS points)");
    } else {
        log_warn(TAG, "TRANSFER FAILED");
    }
}

// ─────────────────── Verification ───────────────────

bool Receiver::verify(TransferOutcome& outcome) {
    if (transfer.overflow || transfer.buffer.size() != transfer.expected_size) {
        log_error(TAG, "SIZE MISMATCH: got " + std::to_string(transfer.buffer.size()) +
                           (transfer.overflow ? "+" : "") + ", expected " +
                           std::to_string(transfer.expected_size));
        return false;
    }
    log_info(TAG, "Size verified OK (" + std::to_string(transfer.expected_size) + " bytes)");

    // Kept whatever the parse verdict is, for diagnosis.
    archive.archive_raw(transfer.buffer);

    ParseResult parsed = parse_records(transfer.buffer);
    outcome.rows_skipped = parsed.rows_skipped;
    if (parsed.records.empty()) {
        log_warn(TAG, "No valid data rows found in CSV");
        return false;
    }

    try {
        outcome.records_inserted = store.persist_batch(parsed.records);
    } catch (const StoreError& e) {
        log_error(TAG, "Storing " + std::to_string(parsed.records.size()) + " records failed: " +
                           e.what());
        return false;
    }
    log_info(TAG, "CSV parsed: " + std::to_string(outcome.records_inserted) + " rows inserted, " +
                      std::to_string(parsed.rows_skipped) + " skipped");
    return outcome.records_inserted > 0;
}

// ─────────────────── Outbound ───────────────────

void Receiver::send_ack() {
    link.write(build_ack());
    log_debug(TAG, "-> ACK");
}

void Receiver::send_commit(uint8_t code) {
    link.write(build_commit(code));
    log_info(TAG, "-> COMMIT (" + hex_byte(code) + (code == COMMIT_OK ? " OK)" : " FAIL)"));
}

void Receiver::reset_transfer(uint32_t expected_size) {
    transfer = Transfer();
    transfer.expected_size = expected_size;
    transfer.buffer.reserve(std::min<size_t>(expected_size, MAX_RESERVE_BYTES));
    transfer.started_at_ms = now_ms();
}

} // namespace uartrx
