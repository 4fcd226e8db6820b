#include "XmByteChannel.h"

#include "xm_protocol.h"

#include <chrono>
#include <iostream>

using Clock = std::chrono::steady_clock;

std::optional<uint8_t> xm_read_byte(XmByteChannel& ch, int timeout_ms) {
    auto got = ch.read(1, timeout_ms);
    if (!got || got->empty()) return std::nullopt;
    return got->front();
}

size_t xm_read_exact(XmByteChannel& ch, std::vector<uint8_t>& out, size_t n, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t have = 0;
    while (have < n) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) break;

        auto got = ch.read(n - have, static_cast<int>(left));
        if (!got) break;
        out.insert(out.end(), got->begin(), got->end());
        have += got->size();
    }
    return have;
}

bool xm_write_all(XmByteChannel& ch, const std::vector<uint8_t>& bytes, int timeout_ms) {
    return ch.write(bytes, timeout_ms) == bytes.size();
}

bool xm_write_byte(XmByteChannel& ch, uint8_t b, int timeout_ms) {
    return xm_write_all(ch, std::vector<uint8_t>{b}, timeout_ms);
}

size_t xm_purge(XmByteChannel& ch, int quiet_ms) {
    size_t dropped = 0;
    if (quiet_ms <= 0) return dropped;
    while (true) {
        auto got = ch.read(1024, quiet_ms);
        if (!got || got->empty()) break;
        dropped += got->size();
    }
    return dropped;
}

void xm_send_cancel(XmByteChannel& ch, int count, int timeout_ms) {
    if (count <= 0) return;
    std::vector<uint8_t> cans(static_cast<size_t>(count), XM_CAN);
    if (ch.write(cans, timeout_ms) != cans.size()) {
        std::cerr << "CAN burst not fully written\n";
    }
}
