#pragma once

#include "xm_transfer.h"

// Retry, cancel and pacing rules shared by sender and receiver. Holds no
// transfer state of its own; counters live in the XmSession it is given.
class XmRetryPolicy {
public:
    explicit XmRetryPolicy(const XmTransferConfig& cfg);

    int retries_per_block() const { return retries_; }
    int cancel_threshold() const { return cancel_threshold_; }
    int pacing_ms() const { return pacing_ms_; }

    // Resets the per-block retry budget.
    void start_block(XmSession& s) const;

    // Spends one retry. Returns false once the budget is already used up.
    bool consume_retry(XmSession& s) const;

    // Records a CAN byte. Returns true when the consecutive-CAN threshold is reached.
    bool note_cancel(XmSession& s) const;

    // Any non-CAN byte breaks a run of CANs.
    void note_other(XmSession& s) const;

    // Sleeps for the inter-block pacing delay.
    void pace() const;

private:
    int retries_;
    int cancel_threshold_;
    int pacing_ms_;
};
