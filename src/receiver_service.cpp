#include "uartrx/receiver_service.h"

#include <chrono>
#include <exception>
#include <string>
#include "uartrx/log.h"

namespace uartrx {

static const char* TAG = "uart_rx";

namespace {

void add_stats(LinkStats& into, const LinkStats& s) {
    into.frames += s.frames;
    into.noise_bytes += s.noise_bytes;
    into.partial_headers += s.partial_headers;
    into.partial_bodies += s.partial_bodies;
    into.bad_checksums += s.bad_checksums;
}

} // namespace

ReceiverService::ReceiverService(LinkFactory factory, RecordStore& store, RawArchive& archive,
                                 uint32_t read_timeout_ms, ReconnectPolicy policy)
    : factory(factory), store(store), archive(archive), read_timeout_ms(read_timeout_ms),
      policy(policy) {}

ReceiverService::~ReceiverService() { stop(); }

void ReceiverService::start() {
    if (worker.joinable()) {
        return;
    }
    stop_requested = false;
    worker = std::thread(&ReceiverService::run, this);
}

void ReceiverService::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mtx);
        stop_requested = true;
    }
    wait_cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

LinkStats ReceiverService::link_stats() const {
    std::lock_guard<std::mutex> lock(stats_mtx);
    LinkStats s = total_stats;
    add_stats(s, session_stats);
    return s;
}

// ─────────────────── Worker loop ───────────────────

void ReceiverService::run() {
    log_info(TAG, "UART receiver thread started");

    while (!stop_requested) {
        std::unique_ptr<SerialLink> link;
        bool failed = false;
        try {
            link = factory();
            if (!link) {
                throw LinkError("no serial link available");
            }
            link->open();
            policy.reset();
            log_info(TAG, "Serial port opened: " + link->name());
            run_session(*link);
        } catch (const LinkError& e) {
            on_failure("Serial error", e.what());
            failed = true;
        } catch (const std::exception& e) {
            // Same recovery as a link error; the receiver must stay up.
            on_failure("Unexpected error", e.what());
            failed = true;
        }

        if (link) {
            link->close();
        }
        {
            std::lock_guard<std::mutex> lock(stats_mtx);
            add_stats(total_stats, session_stats);
            session_stats = LinkStats();
        }
        if (failed) {
            wait_backoff();
        }
    }

    log_info(TAG, "UART receiver thread stopped");
}

void ReceiverService::run_session(SerialLink& link) {
    LinkReader reader(link, read_timeout_ms);
    Receiver rx(link, store, archive, transfer_status);

    try {
        while (!stop_requested) {
            Frame frame;
            ReadResult r = reader.read_frame(frame);
            {
                std::lock_guard<std::mutex> lock(stats_mtx);
                session_stats = reader.stats();
            }
            if (r == FRAME_RECEIVED) {
                rx.handle_frame(frame);
            }
        }
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> lock(stats_mtx);
            session_stats = reader.stats();
        }
        rx.abort();
        throw;
    }

    // Stopped from outside; a half-finished transfer is dropped.
    rx.abort();
}

void ReceiverService::on_failure(const char* kind, const char* what) {
    failures++;
    transfer_status.set_active(false);
    log_error(TAG, std::string(kind) + ": " + what);
}

void ReceiverService::wait_backoff() {
    uint32_t delay = policy.next_delay();
    log_info(TAG, "Retrying in " + std::to_string(delay) + " ms");
    std::unique_lock<std::mutex> lock(wait_mtx);
    wait_cv.wait_for(lock, std::chrono::milliseconds(delay), [this] { return stop_requested.load(); });
}

} // namespace uartrx
