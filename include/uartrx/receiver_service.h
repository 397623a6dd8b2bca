#ifndef UARTRX_RECEIVER_SERVICE_H
#define UARTRX_RECEIVER_SERVICE_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "link_reader.h"
#include "raw_archive.h"
#include "receiver.h"
#include "reconnect_policy.h"
#include "record_store.h"
#include "serial_link.h"
#include "transfer_status.h"

namespace uartrx {

typedef std::function<std::unique_ptr<SerialLink>()> LinkFactory;

// Runs the link reader and the receiver state machine on one worker thread.
// A failed link is closed, and reopened from the factory after the policy's
// backoff; no transfer state survives that.
class ReceiverService {
public:
    ReceiverService(LinkFactory factory, RecordStore& store, RawArchive& archive,
                    uint32_t read_timeout_ms = READ_TIMEOUT_MS,
                    ReconnectPolicy policy = ReconnectPolicy());
    ~ReceiverService();

    ReceiverService(const ReceiverService&) = delete;
    ReceiverService& operator=(const ReceiverService&) = delete;

    void start();
    // Returns once the worker has exited; at most one read timeout later.
    void stop();
    bool running() const { return worker.joinable() && !stop_requested; }

    const TransferStatus& status() const { return transfer_status; }
    LinkStats link_stats() const;
    uint64_t link_failures() const { return failures; }

private:
    LinkFactory factory;
    RecordStore& store;
    RawArchive& archive;
    uint32_t read_timeout_ms;
    ReconnectPolicy policy;

    TransferStatus transfer_status;
    std::atomic<bool> stop_requested{false};
    std::atomic<uint64_t> failures{0};
    std::thread worker;

    std::mutex wait_mtx;
    std::condition_variable wait_cv;

    mutable std::mutex stats_mtx;
    LinkStats total_stats; // sessions already closed
    LinkStats session_stats;

    void run();
    void run_session(SerialLink& link);
    void on_failure(const char* kind, const char* what);
    void wait_backoff();
};

} // namespace uartrx

#endif // UARTRX_RECEIVER_SERVICE_H
