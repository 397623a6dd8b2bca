#ifndef UARTRX_CONFIG_H
#define UARTRX_CONFIG_H

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include "constants.h"
#include "log.h"
#include "reconnect_policy.h"

namespace uartrx {

struct Config {
    std::string serial_port = "/dev/ttyAMA3";
    uint32_t baud = 115200;
    std::string store_path = "watermelon_hub.db";
    std::string archive_dir = "received_files";
    uint32_t read_timeout_ms = READ_TIMEOUT_MS;
    ReconnectPolicy reconnect;
    uint32_t status_interval_s = 30; // 0 disables the periodic status line
    LogLevel log_level = LOG_INFO;
};

typedef std::function<const char*(const char*)> EnvLookup;

// HUB_SERIAL_PORT, HUB_SERIAL_BAUD, HUB_DB_PATH, HUB_FILES_DIR, HUB_LOG_LEVEL.
void apply_env(Config& config, const EnvLookup& lookup, std::ostream& err);
void apply_env(Config& config, std::ostream& err);

enum ArgsResult {
    ARGS_OK,
    ARGS_HELP
};

// Bad values are reported on `err` and leave the previous setting in place.
ArgsResult parse_args(int argc, const char* const argv[], Config& config, std::ostream& err);

void print_usage(const char* program, std::ostream& out);
void print_config(const Config& config, std::ostream& out);

} // namespace uartrx

#endif // UARTRX_CONFIG_H
