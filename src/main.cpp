#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "uartrx/config.h"
#include "uartrx/log.h"
#include "uartrx/raw_archive.h"
#include "uartrx/receiver_service.h"
#include "uartrx/record_store.h"
#include "uartrx/serial_port.h"

using namespace uartrx;

namespace {

volatile std::sig_atomic_t shutdown_requested = 0;

void on_signal(int) { shutdown_requested = 1; }

void print_status(const ReceiverService& service, const RecordStore& store) {
    StatusSnapshot s = service.status().snapshot();
    LinkStats ls = service.link_stats();
    std::cout << "[STATUS] active=" << (s.transfer_active ? "yes" : "no") << " last="
              << (!s.last_transfer_ok ? "none" : (*s.last_transfer_ok ? "ok" : "failed"))
              << " transfers=" << s.total_transfers << " points=" << store.count()
              << " | frames=" << ls.frames << " noise=" << ls.noise_bytes
              << " bad=" << ls.bad_checksums + ls.partial_headers + ls.partial_bodies
              << " reopen=" << service.link_failures() << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    Config config;
    apply_env(config, std::cerr);
    if (parse_args(argc, argv, config, std::cerr) == ARGS_HELP) {
        print_usage(argv[0], std::cout);
        return 0;
    }
    set_log_level(config.log_level);

    std::cout << "[MAIN] Starting UART file receiver..." << std::endl;
    print_config(config, std::cout);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::unique_ptr<SqliteRecordStore> db;
    try {
        db.reset(new SqliteRecordStore(config.store_path));
    } catch (const StoreError& e) {
        std::cerr << "[MAIN] " << e.what() << std::endl;
        return 1;
    }
    RecordStore& store = *db;
    DirectoryArchive archive(config.archive_dir);

    std::string port = config.serial_port;
    uint32_t baud = config.baud;
    ReceiverService service(
        [port, baud]() { return std::unique_ptr<SerialLink>(new PosixSerialPort(port, baud)); },
        store, archive, config.read_timeout_ms, config.reconnect);
    service.start();

    auto last_print = std::chrono::steady_clock::now();
    while (!shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (config.status_interval_s == 0) {
            continue;
        }
        auto now = std::chrono::steady_clock::now();
        if (now - last_print >= std::chrono::seconds(config.status_interval_s)) {
            print_status(service, store);
            last_print = now;
        }
    }

    std::cout << "[MAIN] Shutting down receiver... " << std::endl;
    service.stop();
    print_status(service, store);
    std::cout << "[MAIN] Done." << std::endl;
    return 0;
}
