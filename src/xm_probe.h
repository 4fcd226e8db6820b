#pragma once

#include "XmByteChannel.h"
#include "XmSerialChannel.h"

#include <atomic>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

struct XmProbeArgs {
    XmSerialArgs serial;
    int timeout_ms = 3000;        // read timeout; monitor poll period
    int test_settle_ms = 500;     // wait after the test bytes
    int control_settle_ms = 200;  // wait after NAK and 'C'
    bool monitor = false;         // dump incoming traffic until stopped
};

std::string xm_hex(const std::vector<uint8_t>& b);
// Non-printable bytes shown as '.'.
std::string xm_printable(const std::vector<uint8_t>& b);

// Reports pending input, sends 01 02 03, NAK and 'C' and prints up to 10 reply
// bytes after each. Returns 0, or 2 if a write failed.
int xm_probe_test(XmByteChannel& ch, const XmProbeArgs& a, std::ostream& out);

// Prints every incoming chunk with a timestamp until stop is set.
void xm_probe_monitor(XmByteChannel& ch, const XmProbeArgs& a, const std::atomic<bool>& stop,
                      std::ostream& out);
