#include "uartrx/serial_port.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

namespace uartrx {

namespace {

bool baud_to_speed(uint32_t baud, speed_t& speed) {
    switch (baud) {
    case 9600:
        speed = B9600;
        return true;
    case 19200:
        speed = B19200;
        return true;
    case 38400:
        speed = B38400;
        return true;
    case 57600:
        speed = B57600;
        return true;
    case 115200:
        speed = B115200;
        return true;
    case 230400:
        speed = B230400;
        return true;
    default:
        return false;
    }
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

PosixSerialPort::PosixSerialPort(const std::string& device, uint32_t baud,
                                 uint32_t write_timeout_ms)
    : device(device), baud(baud), write_timeout_ms(write_timeout_ms) {}

PosixSerialPort::~PosixSerialPort() { close(); }

bool PosixSerialPort::is_supported_baud(uint32_t baud) {
    speed_t unused;
    return baud_to_speed(baud, unused);
}

void PosixSerialPort::open() {
    close();
    fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        fail("open");
    }
    configure();
}

void PosixSerialPort::configure() {
    speed_t speed;
    if (!baud_to_speed(baud, speed)) {
        close();
        throw LinkError(device + ": unsupported baud rate " + std::to_string(baud));
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0) {
        fail("tcgetattr");
    }
    cfmakeraw(&tio);
    tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        fail("tcsetattr");
    }

    // Drop boot chatter queued before we opened.
    tcflush(fd, TCIOFLUSH);
}

void PosixSerialPort::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool PosixSerialPort::is_open() const { return fd >= 0; }

size_t PosixSerialPort::read(uint8_t* buf, size_t size, uint32_t timeout_ms) {
    if (fd < 0) {
        throw LinkError(device + ": read on closed port");
    }

    size_t got = 0;
    int64_t deadline = now_ms() + timeout_ms;

    while (got < size) {
        int64_t remaining = deadline - now_ms();
        if (remaining <= 0) {
            break;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, (int)remaining);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail("poll");
        }
        if (rc == 0) {
            break; // timeout
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            throw LinkError(device + ": device error or hangup");
        }

        ssize_t n = ::read(fd, buf + got, size - got);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            fail("read");
        }
        if (n == 0) {
            // Readable but empty: the device went away (USB adapter unplugged).
            throw LinkError(device + ": end of file");
        }
        got += (size_t)n;
    }
    return got;
}

void PosixSerialPort::write(const std::vector<uint8_t>& data) {
    if (fd < 0) {
        throw LinkError(device + ": write on closed port");
    }

    int64_t deadline = now_ms() + write_timeout_ms;
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::write(fd, data.data() + sent, data.size() - sent);
        if (n >= 0) {
            sent += (size_t)n;
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            fail("write");
        }

        // Output buffer full: wait for room, but not past the deadline.
        int64_t remaining = deadline - now_ms();
        if (remaining <= 0) {
            timed_out("write");
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, (int)remaining);
        if (rc < 0 && errno != EINTR) {
            fail("poll");
        }
        if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
            throw LinkError(device + ": device error or hangup");
        }
    }

    drain(deadline);
}

// tcdrain() with a deadline: poll the driver's output queue until it is empty.
void PosixSerialPort::drain(int64_t deadline) {
    while (true) {
        int queued = 0;
        if (::ioctl(fd, TIOCOUTQ, &queued) != 0) {
            fail("TIOCOUTQ");
        }
        if (queued == 0) {
            return;
        }
        if (now_ms() >= deadline) {
            timed_out("drain");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

std::string PosixSerialPort::name() const { return device; }

void PosixSerialPort::timed_out(const char* what) {
    close();
    throw LinkError(device + ": " + what + " timed out after " + std::to_string(write_timeout_ms) +
                    " ms");
}

void PosixSerialPort::fail(const std::string& what) {
    std::string msg = device + ": " + what + " failed: " + std::strerror(errno);
    close();
    throw LinkError(msg);
}

} // namespace uartrx
