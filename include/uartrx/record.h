#ifndef UARTRX_RECORD_H
#define UARTRX_RECORD_H

#include <string>

namespace uartrx {

// One row of the sender's GPS log.
struct GpsPoint {
    std::string utc_time;
    double latitude = 0.0;
    double longitude = 0.0;
    int fix_quality = 0;
    int num_satellites = 0;
    double hdop = 0.0;
    double altitude = 0.0;
    double geoid_height = 0.0;
};

} // namespace uartrx

#endif // UARTRX_RECORD_H
