#include "xm_probe.h"

#include "xm_protocol.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms;
    return os.str();
}

bool exchange(XmByteChannel& ch, const std::vector<uint8_t>& bytes, int settle_ms, int timeout_ms,
              const char* what, std::ostream& out) {
    out << "  Sending " << what << "...\n";
    if (ch.write(bytes, timeout_ms) != bytes.size()) {
        std::cerr << "Failed to write " << what << "\n";
        return false;
    }
    if (settle_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(settle_ms));

    auto got = ch.read(10, timeout_ms);
    if (got && !got->empty()) {
        out << "    Response: " << xm_hex(*got) << " (" << xm_printable(*got) << ")\n";
    } else {
        out << "    No response\n";
    }
    return true;
}

} // namespace

std::string xm_hex(const std::vector<uint8_t>& b) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (uint8_t c : b) os << std::setw(2) << (int)c;
    return os.str();
}

std::string xm_printable(const std::vector<uint8_t>& b) {
    std::string s;
    for (uint8_t c : b) s += std::isprint(c) ? (char)c : '.';
    return s;
}

int xm_probe_test(XmByteChannel& ch, const XmProbeArgs& a, std::ostream& out) {
    out << "Port: " << a.serial.device << "\n"
        << "Baudrate: " << a.serial.baud << "\n"
        << "Flow control: " << (a.serial.rtscts ? "RTS/CTS" : "none") << "\n"
        << "Timeout: " << a.timeout_ms << " ms\n";

    out << "\nChecking for pending input...\n";
    auto pending = ch.read(4096, 50);
    if (pending && !pending->empty()) {
        out << "  Found " << pending->size() << " bytes: " << xm_hex(*pending)
            << " (" << xm_printable(*pending) << ")\n";
    } else {
        out << "  No data in input buffer\n";
    }

    out << "\nTesting basic communication...\n";
    if (!exchange(ch, {0x01, 0x02, 0x03}, a.test_settle_ms, a.timeout_ms, "test bytes 01 02 03", out)) {
        return 2;
    }

    out << "\nTesting XMODEM control characters...\n";
    if (!exchange(ch, {XM_NAK}, a.control_settle_ms, a.timeout_ms, "NAK (0x15)", out)) return 2;
    if (!exchange(ch, {XM_CRC}, a.control_settle_ms, a.timeout_ms, "C (0x43) for CRC mode", out)) {
        return 2;
    }

    out << "\nSerial test completed\n";
    return 0;
}

void xm_probe_monitor(XmByteChannel& ch, const XmProbeArgs& a, const std::atomic<bool>& stop,
                      std::ostream& out) {
    out << "Monitoring " << a.serial.device << " at " << a.serial.baud
        << " baud (Ctrl+C to stop)...\n";
    while (!stop.load()) {
        auto got = ch.read(4096, a.timeout_ms);
        if (!got || got->empty()) continue;
        out << "[" << timestamp() << "] Received " << got->size() << " bytes: "
            << xm_hex(*got) << " (" << xm_printable(*got) << ")\n" << std::flush;
    }
    out << "\nMonitoring stopped.\n";
}
