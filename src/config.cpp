#include "uartrx/config.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "uartrx/serial_port.h"

namespace uartrx {

namespace {

bool to_u32(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || v > 0xFFFFFFFFul) {
        return false;
    }
    out = (uint32_t)v;
    return true;
}

bool to_multiplier(const std::string& text, double& out) {
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0' || v < 1.0) {
        return false;
    }
    out = v;
    return true;
}

void set_baud(Config& c, const std::string& v, std::ostream& err) {
    uint32_t baud;
    if (to_u32(v, baud) && PosixSerialPort::is_supported_baud(baud)) {
        c.baud = baud;
    } else {
        err << "Error: unsupported baud rate \"" << v << "\", using " << c.baud << std::endl;
    }
}

void set_level(Config& c, const std::string& v, std::ostream& err) {
    LogLevel level;
    if (parse_log_level(v, level)) {
        c.log_level = level;
    } else {
        err << "Error: unknown log level \"" << v << "\", keeping current level" << std::endl;
    }
}

void set_ms(uint32_t& field, const char* opt, const std::string& v, std::ostream& err) {
    uint32_t ms;
    if (to_u32(v, ms) && ms > 0) {
        field = ms;
    } else {
        err << "Error: " << opt << " needs a positive number, got \"" << v << "\", using " << field
            << std::endl;
    }
}

} // namespace

// ─────────────────── Environment ───────────────────

void apply_env(Config& c, const EnvLookup& lookup, std::ostream& err) {
    const char* v = lookup("HUB_SERIAL_PORT");
    if (v && *v) {
        c.serial_port = v;
    }
    v = lookup("HUB_SERIAL_BAUD");
    if (v && *v) {
        set_baud(c, v, err);
    }
    v = lookup("HUB_DB_PATH");
    if (v && *v) {
        c.store_path = v;
    }
    v = lookup("HUB_FILES_DIR");
    if (v && *v) {
        c.archive_dir = v;
    }
    v = lookup("HUB_LOG_LEVEL");
    if (v && *v) {
        set_level(c, v, err);
    }
}

void apply_env(Config& c, std::ostream& err) {
    apply_env(c, [](const char* name) { return (const char*)std::getenv(name); }, err);
}

// ─────────────────── Command line ───────────────────

ArgsResult parse_args(int argc, const char* const argv[], Config& c, std::ostream& err) {
    for (int i = 1; i < argc; i++) {
        std::string opt = argv[i];
        if (opt == "-h" || opt == "--help") {
            return ARGS_HELP;
        }

        if (i + 1 >= argc) {
            err << "Error: " << opt << " is not a valid option or is missing its value, ignoring"
                << std::endl;
            continue;
        }
        std::string v = argv[i + 1];

        if (opt == "--port") {
            c.serial_port = v;
        } else if (opt == "--baud") {
            set_baud(c, v, err);
        } else if (opt == "--store") {
            c.store_path = v;
        } else if (opt == "--archive") {
            c.archive_dir = v;
        } else if (opt == "--read-timeout") {
            set_ms(c.read_timeout_ms, "--read-timeout", v, err);
        } else if (opt == "--backoff") {
            set_ms(c.reconnect.initial_ms, "--backoff", v, err);
            if (c.reconnect.max_ms < c.reconnect.initial_ms) {
                c.reconnect.max_ms = c.reconnect.initial_ms;
            }
        } else if (opt == "--backoff-max") {
            set_ms(c.reconnect.max_ms, "--backoff-max", v, err);
        } else if (opt == "--backoff-multiplier") {
            if (!to_multiplier(v, c.reconnect.multiplier)) {
                err << "Error: --backoff-multiplier needs a number >= 1, got \"" << v << "\", using "
                    << c.reconnect.multiplier << std::endl;
            }
        } else if (opt == "--status-interval") {
            if (!to_u32(v, c.status_interval_s)) {
                err << "Error: --status-interval needs a number of seconds, got \"" << v
                    << "\", using " << c.status_interval_s << std::endl;
            }
        } else if (opt == "--log-level") {
            set_level(c, v, err);
        } else {
            err << "Error: unknown option " << opt << ", ignoring" << std::endl;
            continue; // the next word may be an option of its own
        }
        i++;
    }
    return ARGS_OK;
}

void print_usage(const char* program, std::ostream& out) {
    out << "Usage: " << program << " [options]\n"
        << "  --port DEV               serial device (HUB_SERIAL_PORT)\n"
        << "  --baud N                 9600..230400 (HUB_SERIAL_BAUD)\n"
        << "  --store FILE             SQLite database (HUB_DB_PATH)\n"
        << "  --archive DIR            raw file backups (HUB_FILES_DIR)\n"
        << "  --read-timeout MS        serial read timeout\n"
        << "  --backoff MS             delay before reopening a failed port\n"
        << "  --backoff-max MS         ceiling for the reopen delay\n"
        << "  --backoff-multiplier X   growth of the reopen delay, 1 = fixed\n"
        << "  --status-interval S      print status every S seconds, 0 = never\n"
        << "  --log-level LEVEL        debug, info, warn, error, off (HUB_LOG_LEVEL)\n";
}

void print_config(const Config& c, std::ostream& out) {
    out << "  port:     " << c.serial_port << " @ " << c.baud << " baud\n"
        << "  store:    " << c.store_path << "\n"
        << "  archive:  " << c.archive_dir << "\n"
        << "  timeouts: read " << c.read_timeout_ms << " ms, reopen " << c.reconnect.initial_ms
        << ".." << c.reconnect.max_ms << " ms (x" << c.reconnect.multiplier << ")" << std::endl;
}

} // namespace uartrx
