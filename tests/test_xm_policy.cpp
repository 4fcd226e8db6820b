#include "XmRetryPolicy.h"
#include "xm_transfer.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

TEST(RetryPolicy, BudgetAllowsExactlyRetriesResends) {
    XmTransferConfig cfg;
    cfg.retries = 3;
    XmRetryPolicy p(cfg);
    XmSession s;

    p.start_block(s);
    EXPECT_TRUE(p.consume_retry(s));
    EXPECT_TRUE(p.consume_retry(s));
    EXPECT_TRUE(p.consume_retry(s));
    EXPECT_FALSE(p.consume_retry(s));
    EXPECT_FALSE(p.consume_retry(s));

    p.start_block(s);
    EXPECT_EQ(s.retries_left, 3);
}

TEST(RetryPolicy, CancelNeedsConsecutiveCans) {
    XmTransferConfig cfg;
    cfg.cancel_threshold = 2;
    XmRetryPolicy p(cfg);
    XmSession s;

    EXPECT_FALSE(p.note_cancel(s));
    p.note_other(s);
    EXPECT_FALSE(p.note_cancel(s));
    EXPECT_TRUE(p.note_cancel(s));
}

TEST(RetryPolicy, PacingSleeps) {
    XmTransferConfig cfg;
    cfg.pacing_ms = 20;
    XmRetryPolicy p(cfg);

    auto t0 = std::chrono::steady_clock::now();
    p.pace();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    EXPECT_GE(ms, 20);
}

TEST(TransferConfig, DefaultsAreValid) {
    XmTransferConfig cfg;
    std::string why;
    EXPECT_TRUE(xm_validate_config(cfg, why)) << why;
    EXPECT_EQ(cfg.retries, 16);
    EXPECT_EQ(cfg.cancel_threshold, 2);
    EXPECT_EQ(cfg.mode, XmMode::Crc16);
    EXPECT_GT(cfg.initial_timeout_ms, cfg.timeout_ms);
}

TEST(TransferConfig, RejectsBadValues) {
    std::string why;

    XmTransferConfig bs;
    bs.block_size = 512;
    EXPECT_FALSE(xm_validate_config(bs, why));

    XmTransferConfig retries;
    retries.retries = 0;
    EXPECT_FALSE(xm_validate_config(retries, why));

    XmTransferConfig cancel;
    cancel.cancel_threshold = 0;
    EXPECT_FALSE(xm_validate_config(cancel, why));

    XmTransferConfig timeout;
    timeout.initial_timeout_ms = 0;
    EXPECT_FALSE(xm_validate_config(timeout, why));

    XmTransferConfig purge;
    purge.timeout_ms = 100;
    purge.purge_ms = 100;
    EXPECT_FALSE(xm_validate_config(purge, why));
    EXPECT_FALSE(why.empty());
}

TEST(TransferStatus, Names) {
    EXPECT_STREQ(xm_status_name(XmStatus::Ok), "ok");
    EXPECT_STREQ(xm_status_name(XmStatus::HandshakeTimeout), "handshake timeout");
    EXPECT_STREQ(xm_status_name(XmStatus::Cancelled), "cancelled");
}
