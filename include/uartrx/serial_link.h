#ifndef UARTRX_SERIAL_LINK_H
#define UARTRX_SERIAL_LINK_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace uartrx {

// Transport failure: the port is gone, unreadable or unwritable.
class LinkError : public std::runtime_error {
public:
    explicit LinkError(const std::string& what) : std::runtime_error(what) {}
};

// Byte-oriented, full-duplex link to the sender.
class SerialLink {
public:
    virtual ~SerialLink() = default;

    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Blocks until `size` bytes arrived or `timeout_ms` expired.
    // Returns the number of bytes read, which is short on timeout.
    virtual size_t read(uint8_t* buf, size_t size, uint32_t timeout_ms) = 0;

    // Writes every byte and drains the output before returning.
    virtual void write(const std::vector<uint8_t>& data) = 0;

    virtual std::string name() const = 0;
};

} // namespace uartrx

#endif // UARTRX_SERIAL_LINK_H
