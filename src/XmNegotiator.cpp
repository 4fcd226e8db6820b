#include "XmNegotiator.h"

#include <algorithm>
#include <chrono>
#include <iostream>

using Clock = std::chrono::steady_clock;

XmNegotiator::XmNegotiator(const XmTransferConfig& cfg, const XmRetryPolicy& policy)
    : cfg_(cfg), policy_(policy), probe_mode_(cfg.mode) {}

XmStatus XmNegotiator::await_probe(XmByteChannel& ch, XmSession& s,
                                   const std::atomic<bool>* cancel) {
    auto start = Clock::now();
    auto elapsed_ms = [&]() -> long long {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    };
    auto deadline = start + std::chrono::milliseconds(cfg_.initial_timeout_ms);

    state_ = State::AwaitingProbe;
    s.cancels = 0;

    while (true) {
        if (cancel && cancel->load()) return XmStatus::Cancelled;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) break;

        // Wake up at least once per steady-state timeout to notice a cancel request.
        int slice = static_cast<int>(std::min<long long>(left, cfg_.timeout_ms));
        auto b = xm_read_byte(ch, slice);
        if (!b) continue;

        if (*b == XM_CRC || *b == XM_NAK) {
            policy_.note_other(s);
            s.mode = (*b == XM_CRC) ? XmMode::Crc16 : XmMode::Checksum;
            state_ = State::Negotiated;
            if (cfg_.verbose) {
                std::cerr << "Handshake complete in " << elapsed_ms() << " ms, mode="
                          << xm_mode_name(s.mode) << "\n";
            }
            return XmStatus::Ok;
        }
        if (*b == XM_CAN) {
            if (policy_.note_cancel(s)) {
                std::cerr << "Handshake cancelled by peer after " << elapsed_ms() << " ms\n";
                return XmStatus::Cancelled;
            }
            continue;
        }
        policy_.note_other(s);
    }

    std::cerr << "Handshake failed after " << elapsed_ms()
              << " ms: no 'C' or NAK from receiver\n";
    return XmStatus::HandshakeTimeout;
}

uint8_t XmNegotiator::next_probe() const {
    if (cfg_.mode == XmMode::Checksum) return XM_NAK;
    if (cfg_.crc_fallback_after > 0 && probes_sent_ >= cfg_.crc_fallback_after) return XM_NAK;
    return XM_CRC;
}

bool XmNegotiator::send_probe(XmByteChannel& ch) {
    uint8_t probe = next_probe();
    if (!xm_write_byte(ch, probe, cfg_.timeout_ms)) return false;

    probe_mode_ = (probe == XM_CRC) ? XmMode::Crc16 : XmMode::Checksum;
    ++probes_sent_;
    if (probe == XM_CRC) ++crc_probes_;
    state_ = State::ProbeSent;

    if (cfg_.verbose) {
        std::cerr << "PROBE " << (probe == XM_CRC ? "'C'" : "NAK")
                  << " (" << probes_sent_ << "/" << cfg_.max_probes << ")\n";
    }
    return true;
}

void XmNegotiator::confirm(XmSession& s) {
    confirm(s, probe_mode_);
}

void XmNegotiator::confirm(XmSession& s, XmMode mode) {
    probe_mode_ = mode;
    s.mode = mode;
    state_ = State::Negotiated;
}
