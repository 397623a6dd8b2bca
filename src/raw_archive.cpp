#include "uartrx/raw_archive.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sys/stat.h>
#include "uartrx/log.h"

namespace uartrx {

static const char* TAG = "archive";

namespace {

bool exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

// mkdir -p
bool make_dirs(const std::string& dir) {
    if (dir.empty()) {
        return true;
    }
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = dir.find('/', pos + 1);
        std::string part = dir.substr(0, pos);
        if (::mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }
    return true;
}

} // namespace

DirectoryArchive::DirectoryArchive(const std::string& dir) : dir(dir) {}

std::string DirectoryArchive::next_path() const {
    std::time_t now = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_buf);

    std::string base = dir + "/gps_points_" + stamp;
    std::string path = base + ".csv";
    // Two transfers inside the same second must not overwrite each other.
    for (int n = 1; exists(path); n++) {
        path = base + "_" + std::to_string(n) + ".csv";
    }
    return path;
}

bool DirectoryArchive::archive_raw(const std::vector<uint8_t>& data) {
    if (!make_dirs(dir)) {
        log_error(TAG, "Failed to create " + dir + ": " + std::strerror(errno));
        return false;
    }

    std::string path = next_path();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (out) {
        out.write((const char*)data.data(), (std::streamsize)data.size());
        out.flush();
    }
    if (!out) {
        log_error(TAG, "Failed to save raw file " + path);
        return false;
    }

    last_file = path;
    log_info(TAG, "Raw backup saved: " + path + " (" + std::to_string(data.size()) + " bytes)");
    return true;
}

} // namespace uartrx
