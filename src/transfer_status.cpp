#include "uartrx/transfer_status.h"

namespace uartrx {

StatusSnapshot TransferStatus::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}

std::optional<TransferOutcome> TransferStatus::last_outcome() const {
    std::lock_guard<std::mutex> lock(mtx);
    return outcome;
}

void TransferStatus::set_active(bool active) {
    std::lock_guard<std::mutex> lock(mtx);
    state.transfer_active = active;
}

void TransferStatus::record_outcome(const TransferOutcome& result) {
    std::lock_guard<std::mutex> lock(mtx);
    state.transfer_active = false;
    state.last_transfer_ok = result.success;
    state.total_transfers++;
    outcome = result;
}

} // namespace uartrx
