#ifndef UARTRX_RAW_ARCHIVE_H
#define UARTRX_RAW_ARCHIVE_H

#include <cstdint>
#include <string>
#include <vector>

namespace uartrx {

// Best-effort backup of received files. A false return never fails a transfer.
class RawArchive {
public:
    virtual ~RawArchive() = default;
    virtual bool archive_raw(const std::vector<uint8_t>& data) = 0;
};

class NullArchive : public RawArchive {
public:
    bool archive_raw(const std::vector<uint8_t>&) override { return true; }
};

// Writes gps_points_YYYYmmdd_HHMMSS.csv files into `dir`, creating it on demand.
class DirectoryArchive : public RawArchive {
public:
    explicit DirectoryArchive(const std::string& dir);

    bool archive_raw(const std::vector<uint8_t>& data) override;

    const std::string& last_path() const { return last_file; }

private:
    std::string dir;
    std::string last_file;

    std::string next_path() const;
};

} // namespace uartrx

#endif // UARTRX_RAW_ARCHIVE_H
