#include "XmRetryPolicy.h"

#include <chrono>
#include <thread>

XmRetryPolicy::XmRetryPolicy(const XmTransferConfig& cfg)
    : retries_(cfg.retries),
      cancel_threshold_(cfg.cancel_threshold),
      pacing_ms_(cfg.pacing_ms) {}

void XmRetryPolicy::start_block(XmSession& s) const {
    s.retries_left = retries_;
}

bool XmRetryPolicy::consume_retry(XmSession& s) const {
    if (s.retries_left <= 0) return false;
    --s.retries_left;
    return true;
}

bool XmRetryPolicy::note_cancel(XmSession& s) const {
    ++s.cancels;
    return s.cancels >= cancel_threshold_;
}

void XmRetryPolicy::note_other(XmSession& s) const {
    s.cancels = 0;
}

void XmRetryPolicy::pace() const {
    if (pacing_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(pacing_ms_));
}
