#ifndef UARTRX_SERIAL_PORT_H
#define UARTRX_SERIAL_PORT_H

#include <string>
#include "constants.h"
#include "serial_link.h"

namespace uartrx {

// Linux TTY in raw 8N1 mode, no flow control. Reads wait with poll().
// A write that cannot hand its bytes to the device and drain them within
// write_timeout_ms closes the port and throws LinkError.
class PosixSerialPort : public SerialLink {
public:
    PosixSerialPort(const std::string& device, uint32_t baud,
                    uint32_t write_timeout_ms = WRITE_TIMEOUT_MS);
    ~PosixSerialPort();

    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    void open() override;
    void close() override;
    bool is_open() const override;
    size_t read(uint8_t* buf, size_t size, uint32_t timeout_ms) override;
    void write(const std::vector<uint8_t>& data) override;
    std::string name() const override;

    static bool is_supported_baud(uint32_t baud);

private:
    std::string device;
    uint32_t baud;
    uint32_t write_timeout_ms;
    int fd = -1;

    void configure();
    void drain(int64_t deadline);
    [[noreturn]] void fail(const std::string& what);
    [[noreturn]] void timed_out(const char* what);
};

} // namespace uartrx

#endif // UARTRX_SERIAL_PORT_H
