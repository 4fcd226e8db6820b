#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Blocking, timeout-bounded byte transport. The protocol engine talks to the
// link only through this interface.
class XmByteChannel {
public:
    virtual ~XmByteChannel() = default;

    // Up to max bytes, or nullopt if nothing arrived within timeout_ms.
    virtual std::optional<std::vector<uint8_t>> read(size_t max, int timeout_ms) = 0;

    // Number of bytes actually written before timeout_ms elapsed.
    virtual size_t write(const std::vector<uint8_t>& bytes, int timeout_ms) = 0;
};

std::optional<uint8_t> xm_read_byte(XmByteChannel& ch, int timeout_ms);

// Accumulates into out until n bytes arrived or timeout_ms elapsed overall.
// Returns the number of bytes appended.
size_t xm_read_exact(XmByteChannel& ch, std::vector<uint8_t>& out, size_t n, int timeout_ms);

bool xm_write_all(XmByteChannel& ch, const std::vector<uint8_t>& bytes, int timeout_ms);
bool xm_write_byte(XmByteChannel& ch, uint8_t b, int timeout_ms);

// Discards input until the line has been quiet for quiet_ms. Returns bytes dropped.
size_t xm_purge(XmByteChannel& ch, int quiet_ms);

// Best effort; the peer may already be gone.
void xm_send_cancel(XmByteChannel& ch, int count, int timeout_ms);
