#pragma once

#include "xm_protocol.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct XmTransferConfig {
    XmMode mode = XmMode::Crc16;        // receiver's preferred integrity mode
    size_t block_size = XM_BLOCK_128;   // 128 or 1024 (sender)
    int retries = 16;                   // retransmissions allowed per block
    int cancel_threshold = 2;           // consecutive CANs that abort
    int timeout_ms = 3000;              // steady-state read timeout
    int initial_timeout_ms = 30000;     // sender waits this long for the first probe
    int probe_interval_ms = 3000;       // receiver probe period
    int max_probes = 16;                // receiver probes before giving up
    int crc_fallback_after = 3;         // unanswered 'C' probes before falling back to NAK; 0 = never
    int pacing_ms = 1;                  // delay after each write
    int purge_ms = 200;                 // quiet period when draining a bad frame
    bool verbose = false;               // per-block logging
};

bool xm_validate_config(const XmTransferConfig& cfg, std::string& why);

enum class XmStatus : uint8_t {
    Ok,
    HandshakeTimeout,
    RetryExhausted,
    EotNotAcknowledged,
    Cancelled,
    NoData,
    LinkError,
    StreamError,
};

const char* xm_status_name(XmStatus s);

struct XmResult {
    XmStatus status = XmStatus::Ok;
    uint64_t bytes = 0;   // payload bytes delivered before the outcome

    bool ok() const { return status == XmStatus::Ok; }
};

struct XmTransferHooks {
    const std::atomic<bool>* cancel = nullptr;     // polled once per step
    std::function<void(uint64_t)> progress;        // running byte count
    std::optional<uint64_t> file_size;             // sender: clamp for the final block
};

enum class XmRole : uint8_t {
    Sender,
    Receiver,
};

// Mutable per-transfer context. Owned by exactly one state machine.
struct XmSession {
    XmRole role = XmRole::Sender;
    XmMode mode = XmMode::Crc16;
    uint8_t block = 1;        // next block to send / expect
    int retries_left = 0;
    int cancels = 0;          // consecutive CAN bytes seen
    uint64_t bytes = 0;
};
