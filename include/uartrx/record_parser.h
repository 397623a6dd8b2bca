#ifndef UARTRX_RECORD_PARSER_H
#define UARTRX_RECORD_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "record.h"

namespace uartrx {

struct ParseResult {
    std::vector<GpsPoint> records;
    size_t rows_skipped = 0;
    std::vector<std::string> errors; // one entry per row rejected by conversion
};

// Turns a received CSV log into GPS points.
//
// Fields follow the usual CSV quoting: a field in double quotes may hold
// commas, and "" inside it is one quote. Line breaks inside quotes are not
// supported; every line is a row.
// A line is taken as a header when its first field is not numeric, so a data
// row starting with garbage is dropped the same way. Rows with fewer than
// GPS_MIN_FIELDS fields are skipped; missing trailing fields default to zero.
// A row whose present fields fail to convert is skipped and reported in
// `errors`, the rest of the file is still parsed.
ParseResult parse_records(const std::vector<uint8_t>& data);
ParseResult parse_records(const std::string& text);

} // namespace uartrx

#endif // UARTRX_RECORD_PARSER_H
