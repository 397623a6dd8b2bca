#ifndef UARTRX_RECONNECT_POLICY_H
#define UARTRX_RECONNECT_POLICY_H

#include <algorithm>
#include <cstdint>
#include "constants.h"

namespace uartrx {

// Delay between attempts to reopen a failed link. The defaults give a fixed
// RECONNECT_BACKOFF_MS; multiplier > 1 grows the delay up to max_ms.
class ReconnectPolicy {
public:
    uint32_t initial_ms = RECONNECT_BACKOFF_MS;
    double multiplier = 1.0;
    uint32_t max_ms = RECONNECT_BACKOFF_MS;

    uint32_t next_delay() {
        uint32_t delay = current_ms == 0 ? initial_ms : current_ms;
        double grown = delay * std::max(1.0, multiplier);
        current_ms = (uint32_t)std::min<double>(grown, std::max(max_ms, initial_ms));
        return std::min(delay, std::max(max_ms, initial_ms));
    }

    void reset() { current_ms = 0; }

private:
    uint32_t current_ms = 0;
};

} // namespace uartrx

#endif // UARTRX_RECONNECT_POLICY_H
