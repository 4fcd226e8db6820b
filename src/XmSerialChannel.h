#pragma once

#include "XmByteChannel.h"

#include <termios.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct XmSerialArgs {
    std::string device;          // e.g. /dev/ttyUSB0
    int baud = 115200;
    bool rtscts = false;         // hardware flow control
    bool exclusive = true;       // TIOCEXCL, keep other processes off the port
    int settle_ms = 200;         // wait after open before the first I/O
    bool debug = false;          // hex-dump traffic to stderr
};

class XmSerialChannel : public XmByteChannel {
public:
    explicit XmSerialChannel(const XmSerialArgs& args);
    ~XmSerialChannel() override;

    XmSerialChannel(const XmSerialChannel&) = delete;
    XmSerialChannel& operator=(const XmSerialChannel&) = delete;

    // Opens and configures the device as raw 8N1. Reports failures on stderr.
    bool init();

    std::optional<std::vector<uint8_t>> read(size_t max, int timeout_ms) override;
    size_t write(const std::vector<uint8_t>& bytes, int timeout_ms) override;

    // Discards whatever is already buffered on the line. Returns bytes dropped.
    size_t drain_input();

    int native_handle() const { return fd; }

private:
    void dump(const char* dir, const uint8_t* data, size_t len) const;

private:
    XmSerialArgs A;
    int fd = -1;
};

// termios speed for a baud rate, or B0 if the rate is not supported.
speed_t xm_baud_to_speed(int baud);
