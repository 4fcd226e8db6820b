#pragma once

#include "XmByteChannel.h"
#include "XmRetryPolicy.h"
#include "xm_transfer.h"

#include <atomic>
#include <cstdint>

// Decides checksum vs CRC mode. The receiver probes ('C' or NAK) and the
// sender waits for a probe; the mode is fixed once for the whole session.
class XmNegotiator {
public:
    enum class State : uint8_t {
        Idle,
        ProbeSent,      // receiver
        AwaitingProbe,  // sender
        Negotiated,
    };

    XmNegotiator(const XmTransferConfig& cfg, const XmRetryPolicy& policy);

    // Sender side. Ok with s.mode set, HandshakeTimeout, or Cancelled.
    XmStatus await_probe(XmByteChannel& ch, XmSession& s, const std::atomic<bool>* cancel);

    // Receiver side.
    bool probes_left() const { return probes_sent_ < cfg_.max_probes; }
    uint8_t next_probe() const;
    bool send_probe(XmByteChannel& ch);
    // A decodable first frame arrived; the last probe's mode is now the session mode.
    void confirm(XmSession& s);
    // As above, for a first frame that decoded in the given mode.
    void confirm(XmSession& s, XmMode mode);

    State state() const { return state_; }
    int probes_sent() const { return probes_sent_; }
    XmMode probe_mode() const { return probe_mode_; }
    // True once any 'C' went out; the sender may have locked onto CRC mode.
    bool crc_probed() const { return crc_probes_ > 0; }

private:
    XmTransferConfig cfg_;
    const XmRetryPolicy& policy_;
    State state_ = State::Idle;
    int probes_sent_ = 0;
    int crc_probes_ = 0;
    XmMode probe_mode_;
};
