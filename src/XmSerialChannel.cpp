#include "XmSerialChannel.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using Clock = std::chrono::steady_clock;

speed_t xm_baud_to_speed(int baud) {
    switch (baud) {
    case 1200:   return B1200;
    case 2400:   return B2400;
    case 4800:   return B4800;
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
#ifdef B460800
    case 460800: return B460800;
#endif
#ifdef B921600
    case 921600: return B921600;
#endif
    default:     return B0;
    }
}

XmSerialChannel::XmSerialChannel(const XmSerialArgs& args) : A(args) {}

XmSerialChannel::~XmSerialChannel() {
    if (fd >= 0) close(fd);
}

bool XmSerialChannel::init() {
    speed_t speed = xm_baud_to_speed(A.baud);
    if (speed == B0) {
        std::cerr << "Unsupported baud rate: " << A.baud << "\n";
        return false;
    }

    fd = ::open(A.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) { perror(A.device.c_str()); return false; }

    if (A.exclusive && ioctl(fd, TIOCEXCL) < 0) {
        perror("ioctl TIOCEXCL");
        return false;
    }

    termios tio{};
    if (tcgetattr(fd, &tio) < 0) { perror("tcgetattr"); return false; }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | PARENB | CSIZE);
    tio.c_cflag |= CS8;
    if (A.rtscts) tio.c_cflag |= CRTSCTS;
    else          tio.c_cflag &= ~CRTSCTS;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    if (cfsetispeed(&tio, speed) < 0 || cfsetospeed(&tio, speed) < 0) {
        perror("cfsetspeed");
        return false;
    }
    if (tcsetattr(fd, TCSANOW, &tio) < 0) { perror("tcsetattr"); return false; }

    // USB adapters may reset on open; let the line settle before talking.
    if (A.settle_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(A.settle_ms));
    if (tcflush(fd, TCIOFLUSH) < 0) { perror("tcflush"); return false; }

    std::cerr << "Opened " << A.device << " at " << A.baud << " baud, 8N1"
              << (A.rtscts ? ", RTS/CTS" : "") << "\n";
    return true;
}

std::optional<std::vector<uint8_t>> XmSerialChannel::read(size_t max, int timeout_ms) {
    if (fd < 0 || max == 0) return std::nullopt;

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return std::nullopt;
    if (pr < 0) {
        if (errno != EINTR) perror("poll");
        return std::nullopt;
    }

    std::vector<uint8_t> buf(max);
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) perror("read");
        return std::nullopt;
    }
    if (n == 0) return std::nullopt;

    buf.resize((size_t)n);
    if (A.debug) dump("RX", buf.data(), buf.size());
    return buf;
}

size_t XmSerialChannel::write(const std::vector<uint8_t>& bytes, int timeout_ms) {
    if (fd < 0) return 0;
    if (A.debug) dump("TX", bytes.data(), bytes.size());

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + sent, bytes.size() - sent);
        if (n > 0) { sent += (size_t)n; continue; }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            perror("write");
            break;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) break;

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int pr = ::poll(&pfd, 1, (int)left);
        if (pr == 0) break;
        if (pr < 0 && errno != EINTR) { perror("poll(POLLOUT)"); break; }
    }

    if (sent == bytes.size() && tcdrain(fd) < 0) perror("tcdrain");
    return sent;
}

size_t XmSerialChannel::drain_input() {
    size_t dropped = 0;
    while (true) {
        auto got = read(4096, 100);
        if (!got) break;
        dropped += got->size();
    }
    if (dropped > 0) std::cerr << "Drained " << dropped << " stale bytes\n";
    return dropped;
}

void XmSerialChannel::dump(const char* dir, const uint8_t* data, size_t len) const {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    size_t shown = len <= 10 ? len : 10;
    for (size_t i = 0; i < shown; ++i) os << std::setw(2) << (int)data[i];
    if (shown < len) os << "...";
    std::cerr << "DEBUG " << dir << " " << std::dec << len << " bytes: " << os.str() << "\n";
}
