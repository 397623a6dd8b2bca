#include "uartrx/record_parser.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>
#include "uartrx/constants.h"
#include "uartrx/log.h"

namespace uartrx {

static const char* TAG = "parser";

// ─────────────────── Field helpers ───────────────────

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return "";
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Comma-separated fields. A double-quoted field may contain commas, and ""
// inside quotes is a literal quote.
std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quoted) {
            if (c != '"') {
                field += c;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                i++;
            } else {
                quoted = false;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

bool to_double(const std::string& field, double& out) {
    std::string s = trim(field);
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) {
        return false;
    }
    out = v;
    return true;
}

bool to_int(const std::string& field, int& out) {
    std::string s = trim(field);
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        return false;
    }
    out = (int)v;
    return true;
}

// Converts the fields of one data row; `bad` names the first column that failed.
bool convert_row(const std::vector<std::string>& row, GpsPoint& p, const char*& bad) {
    p.utc_time = trim(row[0]);
    if (row.size() > 1 && !to_double(row[1], p.latitude)) {
        bad = "latitude";
        return false;
    }
    if (row.size() > 2 && !to_double(row[2], p.longitude)) {
        bad = "longitude";
        return false;
    }
    if (row.size() > 3 && !to_int(row[3], p.fix_quality)) {
        bad = "fix_quality";
        return false;
    }
    if (row.size() > 4 && !to_int(row[4], p.num_satellites)) {
        bad = "num_satellites";
        return false;
    }
    if (row.size() > 5 && !to_double(row[5], p.hdop)) {
        bad = "hdop";
        return false;
    }
    if (row.size() > 6 && !to_double(row[6], p.altitude)) {
        bad = "altitude";
        return false;
    }
    if (row.size() > 7 && !to_double(row[7], p.geoid_height)) {
        bad = "geoid_height";
        return false;
    }
    return true;
}

} // namespace

// ─────────────────── Parser ───────────────────

ParseResult parse_records(const std::vector<uint8_t>& data) {
    return parse_records(std::string(data.begin(), data.end()));
}

ParseResult parse_records(const std::string& text) {
    ParseResult result;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }

        std::vector<std::string> row = split_fields(line);
        if (row.size() < GPS_MIN_FIELDS) {
            result.rows_skipped++;
            log_debug(TAG, "Skipping short row " + std::to_string(line_no) + " (" +
                                std::to_string(row.size()) + " fields)");
            continue;
        }

        double first;
        if (!to_double(row[0], first)) {
            result.rows_skipped++;
            log_debug(TAG, "Skipping header row: " + line);
            continue;
        }

        GpsPoint p;
        const char* bad = "";
        if (!convert_row(row, p, bad)) {
            result.rows_skipped++;
            std::ostringstream err;
            err << "line " << line_no << ": bad " << bad << " in \"" << line << "\"";
            result.errors.push_back(err.str());
            log_warn(TAG, "Skipping malformed row, " + err.str());
            continue;
        }
        result.records.push_back(p);
    }
    return result;
}

} // namespace uartrx
