#include "XmSender.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

using Clock = std::chrono::steady_clock;

XmSender::XmSender(XmByteChannel& channel, std::istream& input, const XmTransferConfig& cfg,
                   XmTransferHooks hooks_in)
    : ch(channel),
      in(input),
      A(cfg),
      hooks(std::move(hooks_in)),
      policy(A),
      negotiator(A, policy) {
    sess.role = XmRole::Sender;
    sess.mode = A.mode;
    sess.block = 1;
    policy.start_block(sess);
}

bool XmSender::finished() const {
    return cur == State::Done || cur == State::Cancelled || cur == State::Failed;
}

XmSender::State XmSender::step() {
    if (finished()) return cur;

    if (hooks.cancel && hooks.cancel->load()) {
        std::cerr << "Send interrupted at blk=" << (int)sess.block
                  << " after " << sess.bytes << " bytes\n";
        xm_send_cancel(ch, policy.cancel_threshold(), A.timeout_ms);
        outcome = XmStatus::Cancelled;
        cur = State::Cancelled;
        return cur;
    }

    switch (cur) {
    case State::AwaitNegotiation: cur = on_await_negotiation(); break;
    case State::SendBlock:        cur = on_send_block(); break;
    case State::AwaitAck:         cur = on_await_ack(); break;
    case State::Retry:            cur = on_retry(); break;
    case State::SendEot:          cur = on_send_eot(); break;
    case State::AwaitEotAck:      cur = on_await_eot_ack(); break;
    case State::Done:
    case State::Cancelled:
    case State::Failed:
        break;
    }
    return cur;
}

XmResult XmSender::run() {
    while (!finished()) step();

    if (cur == State::Done) {
        if (A.verbose) {
            std::cerr << "All blocks ACKed, EOT ACKed. Sent " << sess.bytes << " bytes\n";
        }
    } else {
        std::cerr << "Send ended: " << xm_status_name(outcome)
                  << " after " << sess.bytes << " bytes\n";
    }
    return XmResult{outcome, sess.bytes};
}

XmSender::State XmSender::on_await_negotiation() {
    XmStatus st = negotiator.await_probe(ch, sess, hooks.cancel);
    if (st == XmStatus::Cancelled) {
        // Local interrupt: tell the receiver. A peer cancel needs no reply.
        if (hooks.cancel && hooks.cancel->load()) {
            xm_send_cancel(ch, policy.cancel_threshold(), A.timeout_ms);
        }
        outcome = XmStatus::Cancelled;
        return State::Cancelled;
    }
    if (st != XmStatus::Ok) return fail(st, false);

    sess.block = 1;
    sess.cancels = 0;
    return next_after_block();
}

XmSender::State XmSender::on_send_block() {
    if (!load_block()) return fail(XmStatus::StreamError, true);
    if (frame_real == 0) return State::SendEot;

    policy.start_block(sess);
    tries = 1;
    if (!xmit(frame)) return fail(XmStatus::LinkError, false);

    if (A.verbose) {
        std::cerr << "DATA blk=" << (int)sess.block << " len=" << frame_real
                  << " (try " << tries << ")\n";
    }
    reply_deadline = Clock::now() + std::chrono::milliseconds(A.timeout_ms);
    return State::AwaitAck;
}

XmSender::State XmSender::on_await_ack() {
    auto b = read_reply();
    if (!b) {
        std::cerr << "  blk=" << (int)sess.block << " timeout waiting ACK -> retransmit\n";
        return retry_block();
    }

    switch (*b) {
    case XM_ACK: {
        policy.note_other(sess);
        uint64_t add = frame_real;
        if (hooks.file_size) {
            uint64_t room = *hooks.file_size > sess.bytes ? *hooks.file_size - sess.bytes : 0;
            add = std::min<uint64_t>(add, room);
        }
        sess.bytes += add;
        if (hooks.progress) hooks.progress(sess.bytes);

        sess.block = static_cast<uint8_t>(sess.block + 1);
        frame.clear();
        frame_real = 0;
        return next_after_block();
    }
    case XM_NAK:
        policy.note_other(sess);
        std::cerr << "  blk=" << (int)sess.block << " NAK -> retransmit\n";
        return retry_block();
    case XM_CAN:
        if (policy.note_cancel(sess)) return cancelled_by_peer();
        return retry_block();
    default:
        // Line noise; keep waiting for the same deadline.
        policy.note_other(sess);
        return State::AwaitAck;
    }
}

XmSender::State XmSender::on_retry() {
    ++tries;
    if (!xmit(frame)) return fail(XmStatus::LinkError, false);

    if (A.verbose) {
        std::cerr << "DATA blk=" << (int)sess.block << " len=" << frame_real
                  << " (try " << tries << ")\n";
    }
    reply_deadline = Clock::now() + std::chrono::milliseconds(A.timeout_ms);
    return State::AwaitAck;
}

XmSender::State XmSender::on_send_eot() {
    if (!eot_started) {
        eot_started = true;
        policy.start_block(sess);
        tries = 0;
    }
    ++tries;
    if (!xmit(std::vector<uint8_t>{XM_EOT})) return fail(XmStatus::LinkError, false);

    if (A.verbose) std::cerr << "EOT (try " << tries << ")\n";
    reply_deadline = Clock::now() + std::chrono::milliseconds(A.timeout_ms);
    return State::AwaitEotAck;
}

XmSender::State XmSender::on_await_eot_ack() {
    auto b = read_reply();
    if (!b) {
        std::cerr << "  timeout waiting EOT ACK -> retransmit\n";
        return retry_eot();
    }

    switch (*b) {
    case XM_ACK:
        policy.note_other(sess);
        outcome = XmStatus::Ok;
        return State::Done;
    case XM_NAK:
        policy.note_other(sess);
        return retry_eot();
    case XM_CAN:
        if (policy.note_cancel(sess)) return cancelled_by_peer();
        return retry_eot();
    default:
        policy.note_other(sess);
        return State::AwaitEotAck;
    }
}

XmSender::State XmSender::retry_block() {
    if (!policy.consume_retry(sess)) {
        std::cerr << "Failed to deliver blk=" << (int)sess.block
                  << " after " << tries << " tries\n";
        return fail(XmStatus::RetryExhausted, true);
    }
    return State::Retry;
}

XmSender::State XmSender::retry_eot() {
    if (!policy.consume_retry(sess)) {
        std::cerr << "Failed to deliver EOT after " << tries << " tries\n";
        return fail(XmStatus::EotNotAcknowledged, true);
    }
    return State::SendEot;
}

XmSender::State XmSender::cancelled_by_peer() {
    std::cerr << "Receiver cancelled at blk=" << (int)sess.block << "\n";
    outcome = XmStatus::Cancelled;
    return State::Cancelled;
}

XmSender::State XmSender::fail(XmStatus why, bool notify_peer) {
    outcome = why;
    if (notify_peer) xm_send_cancel(ch, policy.cancel_threshold(), A.timeout_ms);
    return State::Failed;
}

bool XmSender::load_block() {
    std::vector<uint8_t> payload(A.block_size);
    in.read(reinterpret_cast<char*>(payload.data()), (std::streamsize)payload.size());
    std::streamsize got = in.gcount();
    if (in.bad() || (in.fail() && !in.eof())) {
        std::cerr << "Failed to read input at blk=" << (int)sess.block << "\n";
        return false;
    }

    frame_real = got > 0 ? (size_t)got : 0;
    if (frame_real == 0) {
        frame.clear();
        return true;
    }
    std::fill(payload.begin() + (std::ptrdiff_t)frame_real, payload.end(), XM_PAD);
    frame = xm_encode_frame(sess.block, payload, sess.mode);
    return true;
}

XmSender::State XmSender::next_after_block() {
    if (in.peek() != std::istream::traits_type::eof()) return State::SendBlock;
    // A failed read that did not reach end of file must not pass for EOF.
    if (in.bad() || !in.eof()) {
        std::cerr << "Failed to read input at blk=" << (int)sess.block << "\n";
        return fail(XmStatus::StreamError, true);
    }
    return State::SendEot;
}

bool XmSender::xmit(const std::vector<uint8_t>& bytes) {
    bool ok = xm_write_all(ch, bytes, A.timeout_ms);
    if (!ok) {
        std::cerr << "Partial write!? expected=" << bytes.size() << "\n";
    } else {
        ++frames;
    }
    policy.pace();
    return ok;
}

std::optional<uint8_t> XmSender::read_reply() {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        reply_deadline - Clock::now()).count();
    if (left <= 0) return std::nullopt;
    return xm_read_byte(ch, static_cast<int>(left));
}

XmResult xm_send(XmByteChannel& channel, std::istream& input, const XmTransferConfig& cfg,
                 const XmTransferHooks& hooks) {
    std::string why;
    if (!xm_validate_config(cfg, why)) {
        throw std::invalid_argument("xm_send: " + why);
    }
    XmSender s(channel, input, cfg, hooks);
    return s.run();
}

const char* xm_sender_state_name(XmSender::State s) {
    switch (s) {
    case XmSender::State::AwaitNegotiation: return "AwaitNegotiation";
    case XmSender::State::SendBlock:        return "SendBlock";
    case XmSender::State::AwaitAck:         return "AwaitAck";
    case XmSender::State::Retry:            return "Retry";
    case XmSender::State::SendEot:          return "SendEot";
    case XmSender::State::AwaitEotAck:      return "AwaitEotAck";
    case XmSender::State::Done:             return "Done";
    case XmSender::State::Cancelled:        return "Cancelled";
    case XmSender::State::Failed:           return "Failed";
    }
    return "?";
}
