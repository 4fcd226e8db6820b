#pragma once

#include "XmByteChannel.h"
#include "XmNegotiator.h"
#include "XmRetryPolicy.h"
#include "xm_transfer.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

class XmSender {
public:
    enum class State : uint8_t {
        AwaitNegotiation,
        SendBlock,
        AwaitAck,
        Retry,
        SendEot,
        AwaitEotAck,
        Done,
        Cancelled,
        Failed,
    };

    XmSender(XmByteChannel& channel, std::istream& input, const XmTransferConfig& cfg,
             XmTransferHooks hooks = {});

    XmSender(const XmSender&) = delete;
    XmSender& operator=(const XmSender&) = delete;

    // Performs exactly one transition and returns the new state.
    State step();
    XmResult run();

    bool finished() const;
    State state() const { return cur; }
    XmStatus status() const { return outcome; }
    const XmSession& session() const { return sess; }
    int frames_written() const { return frames; }

private:
    State on_await_negotiation();
    State on_send_block();
    State on_await_ack();
    State on_retry();
    State on_send_eot();
    State on_await_eot_ack();

    State retry_block();
    State retry_eot();
    State cancelled_by_peer();
    State fail(XmStatus why, bool notify_peer);

    bool load_block();
    State next_after_block();
    bool xmit(const std::vector<uint8_t>& bytes);
    std::optional<uint8_t> read_reply();

private:
    XmByteChannel& ch;
    std::istream& in;
    XmTransferConfig A;
    XmTransferHooks hooks;
    XmRetryPolicy policy;
    XmNegotiator negotiator;

    XmSession sess;
    State cur = State::AwaitNegotiation;
    XmStatus outcome = XmStatus::Ok;

    std::vector<uint8_t> frame;   // retry buffer for the block in flight
    size_t frame_real = 0;        // non-padding bytes in frame
    int tries = 0;
    int frames = 0;
    bool eot_started = false;
    std::chrono::steady_clock::time_point reply_deadline{};
};

// Sends the whole of input. On success bytes is the file length.
// Throws std::invalid_argument if cfg fails xm_validate_config.
XmResult xm_send(XmByteChannel& channel, std::istream& input, const XmTransferConfig& cfg,
                 const XmTransferHooks& hooks = {});

const char* xm_sender_state_name(XmSender::State s);
