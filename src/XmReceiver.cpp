#include "XmReceiver.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

using Clock = std::chrono::steady_clock;

XmReceiver::XmReceiver(XmByteChannel& channel, std::ostream& output, const XmTransferConfig& cfg,
                       XmTransferHooks hooks_in)
    : ch(channel),
      out(output),
      A(cfg),
      hooks(std::move(hooks_in)),
      policy(A),
      negotiator(A, policy) {
    sess.role = XmRole::Receiver;
    sess.mode = A.mode;
    sess.block = 1;
    policy.start_block(sess);
}

bool XmReceiver::finished() const {
    return cur == State::Done || cur == State::Cancelled || cur == State::Failed;
}

XmReceiver::State XmReceiver::step() {
    if (finished()) return cur;

    if (hooks.cancel && hooks.cancel->load()) {
        std::cerr << "Receive interrupted at blk=" << (int)sess.block
                  << " after " << sess.bytes << " bytes\n";
        xm_send_cancel(ch, policy.cancel_threshold(), A.timeout_ms);
        outcome = XmStatus::Cancelled;
        cur = State::Cancelled;
        return cur;
    }

    switch (cur) {
    case State::Probe:       cur = on_probe(); break;
    case State::AwaitFrame:  cur = on_await_frame(); break;
    case State::VerifyFrame: cur = on_verify_frame(); break;
    case State::AwaitEot:    cur = on_await_eot(); break;
    case State::Done:
    case State::Cancelled:
    case State::Failed:
        break;
    }
    return cur;
}

XmResult XmReceiver::run() {
    while (!finished()) step();

    if (cur != State::Done) {
        std::cerr << "Receive ended: " << xm_status_name(outcome)
                  << " after " << sess.bytes << " bytes\n";
    }
    return XmResult{outcome, sess.bytes};
}

XmReceiver::State XmReceiver::on_probe() {
    if (!negotiator.probes_left()) {
        std::cerr << "No sender after " << negotiator.probes_sent() << " probes\n";
        outcome = XmStatus::HandshakeTimeout;
        return State::Failed;
    }
    if (!negotiator.send_probe(ch)) return fail(XmStatus::LinkError, false);
    policy.pace();
    return State::AwaitFrame;
}

XmReceiver::State XmReceiver::on_await_frame() {
    int wait_ms = negotiated() ? A.timeout_ms : A.probe_interval_ms;
    auto deadline = Clock::now() + std::chrono::milliseconds(wait_ms);

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) break;

        auto b = xm_read_byte(ch, static_cast<int>(left));
        if (!b) break;

        size_t block_size = xm_block_size_for(*b);
        if (block_size != 0) {
            policy.note_other(sess);
            saw_data = true;
            frame.assign(1, *b);
            size_t rest = xm_frame_len(block_size, frame_mode()) - 1;
            if (xm_read_exact(ch, frame, rest, A.timeout_ms) < rest && A.verbose) {
                std::cerr << "  short frame: " << frame.size() << " bytes\n";
            }
            return State::VerifyFrame;
        }
        if (*b == XM_EOT) {
            policy.note_other(sess);
            return State::AwaitEot;
        }
        if (*b == XM_CAN) {
            if (policy.note_cancel(sess)) {
                std::cerr << "Sender cancelled at blk=" << (int)sess.block << "\n";
                outcome = XmStatus::Cancelled;
                return State::Cancelled;
            }
            continue;
        }
        // Noise at the header position.
        policy.note_other(sess);
    }

    if (!negotiated()) return State::Probe;
    return on_timeout();
}

XmReceiver::State XmReceiver::on_verify_frame() {
    XmBlock blk;
    XmMode mode = frame_mode();
    size_t block_size = xm_block_size_for(frame[0]);

    if (!negotiated() && mode == XmMode::Checksum && negotiator.crc_probed()) {
        // A sender that answered an earlier 'C' keeps sending CRC frames after
        // we fell back to NAK probes. A checksum frame never has the second trailer byte.
        size_t crc_len = xm_frame_len(block_size, XmMode::Crc16);
        if (frame.size() + 1 == crc_len) {
            xm_read_exact(ch, frame, 1, A.purge_ms > 0 ? A.purge_ms : A.timeout_ms);
        }
        if (frame.size() == crc_len) mode = XmMode::Crc16;
    }
    FrameError err = xm_decode_frame(frame.data(), frame.size(), block_size, mode, blk);
    if (err != FrameError::None) return reject(xm_frame_error_name(err));

    if (!negotiated()) {
        negotiator.confirm(sess, mode);
        if (A.verbose) std::cerr << "Negotiated mode=" << xm_mode_name(sess.mode) << "\n";
    }

    if (blk.number == sess.block) {
        out.write(reinterpret_cast<const char*>(blk.payload.data()),
                  (std::streamsize)blk.payload.size());
        if (!out) {
            std::cerr << "Failed to write output at blk=" << (int)sess.block << "\n";
            return fail(XmStatus::StreamError, true);
        }
        if (!reply(XM_ACK)) return fail(XmStatus::LinkError, false);

        sess.bytes += blk.payload.size();
        if (hooks.progress) hooks.progress(sess.bytes);
        if (A.verbose) {
            std::cerr << "DATA blk=" << (int)blk.number << " len=" << blk.payload.size()
                      << " -> delivered, total=" << sess.bytes << " bytes\n";
        }

        sess.block = static_cast<uint8_t>(sess.block + 1);
        policy.start_block(sess);
        saw_data = false;
        accepted_any = true;
        return State::AwaitFrame;
    }

    if (accepted_any && blk.number == static_cast<uint8_t>(sess.block - 1)) {
        // Our ACK was lost and the sender repeated the block.
        ++dups;
        if (!reply(XM_ACK)) return fail(XmStatus::LinkError, false);
        std::cerr << "Duplicate blk=" << (int)blk.number << " -> re-ACK\n";
        return State::AwaitFrame;
    }

    std::cerr << "  unexpected blk=" << (int)blk.number
              << " (expected " << (int)sess.block << ")\n";
    return reject("out of sequence");
}

XmReceiver::State XmReceiver::on_await_eot() {
    if (!negotiated()) negotiator.confirm(sess);
    if (!reply(XM_ACK)) return fail(XmStatus::LinkError, false);

    if (A.verbose) {
        std::cerr << "EOT -> ACKed. Total received=" << sess.bytes << " bytes\n";
    }
    outcome = XmStatus::Ok;
    return State::Done;
}

XmReceiver::State XmReceiver::reject(const char* why) {
    std::cerr << "  bad frame at blk=" << (int)sess.block << " (" << why << ") -> NAK\n";
    xm_purge(ch, A.purge_ms);

    if (!policy.consume_retry(sess)) {
        std::cerr << "Too many errors on blk=" << (int)sess.block << "\n";
        return fail(XmStatus::RetryExhausted, true);
    }
    ++naks;
    if (!reply(XM_NAK)) return fail(XmStatus::LinkError, false);
    return State::AwaitFrame;
}

XmReceiver::State XmReceiver::on_timeout() {
    std::cerr << "  timeout waiting blk=" << (int)sess.block << " -> NAK\n";
    if (!policy.consume_retry(sess)) {
        return fail(saw_data ? XmStatus::RetryExhausted : XmStatus::NoData, true);
    }
    ++naks;
    if (!reply(XM_NAK)) return fail(XmStatus::LinkError, false);
    return State::AwaitFrame;
}

XmReceiver::State XmReceiver::fail(XmStatus why, bool notify_peer) {
    outcome = why;
    if (notify_peer) xm_send_cancel(ch, policy.cancel_threshold(), A.timeout_ms);
    return State::Failed;
}

XmMode XmReceiver::frame_mode() const {
    return negotiated() ? sess.mode : negotiator.probe_mode();
}

bool XmReceiver::reply(uint8_t b) {
    bool ok = xm_write_byte(ch, b, A.timeout_ms);
    if (!ok) std::cerr << "Failed to write reply 0x" << std::hex << (int)b << std::dec << "\n";
    policy.pace();
    return ok;
}

XmResult xm_receive(XmByteChannel& channel, std::ostream& output, const XmTransferConfig& cfg,
                    const XmTransferHooks& hooks) {
    std::string why;
    if (!xm_validate_config(cfg, why)) {
        throw std::invalid_argument("xm_receive: " + why);
    }
    XmReceiver r(channel, output, cfg, hooks);
    return r.run();
}

const char* xm_receiver_state_name(XmReceiver::State s) {
    switch (s) {
    case XmReceiver::State::Probe:       return "Probe";
    case XmReceiver::State::AwaitFrame:  return "AwaitFrame";
    case XmReceiver::State::VerifyFrame: return "VerifyFrame";
    case XmReceiver::State::AwaitEot:    return "AwaitEot";
    case XmReceiver::State::Done:        return "Done";
    case XmReceiver::State::Cancelled:   return "Cancelled";
    case XmReceiver::State::Failed:      return "Failed";
    }
    return "?";
}
