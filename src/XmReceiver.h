#pragma once

#include "XmByteChannel.h"
#include "XmNegotiator.h"
#include "XmRetryPolicy.h"
#include "xm_transfer.h"

#include <cstdint>
#include <ostream>
#include <vector>

// Writes every verified block to the output in order. The final block keeps
// its 0x1A padding: XMODEM framing does not carry the true file length.
class XmReceiver {
public:
    enum class State : uint8_t {
        Probe,
        AwaitFrame,
        VerifyFrame,
        AwaitEot,
        Done,
        Cancelled,
        Failed,
    };

    XmReceiver(XmByteChannel& channel, std::ostream& output, const XmTransferConfig& cfg,
               XmTransferHooks hooks = {});

    XmReceiver(const XmReceiver&) = delete;
    XmReceiver& operator=(const XmReceiver&) = delete;

    State step();
    XmResult run();

    bool finished() const;
    State state() const { return cur; }
    XmStatus status() const { return outcome; }
    const XmSession& session() const { return sess; }
    const XmNegotiator& handshake() const { return negotiator; }
    int naks_sent() const { return naks; }
    int duplicates() const { return dups; }

private:
    State on_probe();
    State on_await_frame();
    State on_verify_frame();
    State on_await_eot();

    State reject(const char* why);
    State on_timeout();
    State fail(XmStatus why, bool notify_peer);

    bool negotiated() const { return negotiator.state() == XmNegotiator::State::Negotiated; }
    XmMode frame_mode() const;
    bool reply(uint8_t b);

private:
    XmByteChannel& ch;
    std::ostream& out;
    XmTransferConfig A;
    XmTransferHooks hooks;
    XmRetryPolicy policy;
    XmNegotiator negotiator;

    XmSession sess;
    State cur = State::Probe;
    XmStatus outcome = XmStatus::Ok;

    std::vector<uint8_t> frame;   // candidate frame, header byte first
    bool saw_data = false;        // any frame bytes for the current block
    bool accepted_any = false;
    int naks = 0;
    int dups = 0;
};

// Receives into output until EOT. bytes counts whole blocks, padding included.
// Throws std::invalid_argument if cfg fails xm_validate_config.
XmResult xm_receive(XmByteChannel& channel, std::ostream& output, const XmTransferConfig& cfg,
                    const XmTransferHooks& hooks = {});

const char* xm_receiver_state_name(XmReceiver::State s);
