#ifndef UARTRX_TRANSFER_STATUS_H
#define UARTRX_TRANSFER_STATUS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

namespace uartrx {

struct TransferOutcome {
    bool success = false;
    size_t bytes_received = 0;
    uint32_t expected_size = 0;
    size_t records_inserted = 0;
    size_t rows_skipped = 0;
    int64_t commit_latency_ms = 0; // END received -> COMMIT written
    std::chrono::system_clock::time_point completed_at;
};

struct StatusSnapshot {
    bool transfer_active = false;
    std::optional<bool> last_transfer_ok; // empty until the first transfer completes
    uint64_t total_transfers = 0;

    bool operator==(const StatusSnapshot& o) const {
        return transfer_active == o.transfer_active && last_transfer_ok == o.last_transfer_ok &&
               total_transfers == o.total_transfers;
    }
    bool operator!=(const StatusSnapshot& o) const { return !(*this == o); }
};

// Shared between the receiver worker (sole writer) and any number of readers.
class TransferStatus {
public:
    StatusSnapshot snapshot() const;
    std::optional<TransferOutcome> last_outcome() const;

    void set_active(bool active);
    void record_outcome(const TransferOutcome& outcome);

private:
    mutable std::mutex mtx;
    StatusSnapshot state;
    std::optional<TransferOutcome> outcome;
};

} // namespace uartrx

#endif // UARTRX_TRANSFER_STATUS_H
