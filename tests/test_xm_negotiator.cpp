#include "XmNegotiator.h"
#include "xm_test_channels.h"

#include <gtest/gtest.h>

#include <atomic>

namespace {

XmTransferConfig quick_config() {
    XmTransferConfig cfg;
    cfg.timeout_ms = 20;
    cfg.initial_timeout_ms = 60;
    cfg.probe_interval_ms = 20;
    cfg.purge_ms = 0;
    cfg.pacing_ms = 0;
    return cfg;
}

} // namespace

TEST(SenderHandshake, CProbeSelectsCrc) {
    auto cfg = quick_config();
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    ch.push_byte(XM_CRC);
    XmSession s;
    s.mode = XmMode::Checksum;

    EXPECT_EQ(n.await_probe(ch, s, nullptr), XmStatus::Ok);
    EXPECT_EQ(s.mode, XmMode::Crc16);
    EXPECT_EQ(n.state(), XmNegotiator::State::Negotiated);
    EXPECT_TRUE(ch.writes.empty());
}

TEST(SenderHandshake, NakSelectsChecksumAfterNoise) {
    auto cfg = quick_config();
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    ch.push({'x', 'y'}).push_timeout().push_byte(XM_NAK);
    XmSession s;

    EXPECT_EQ(n.await_probe(ch, s, nullptr), XmStatus::Ok);
    EXPECT_EQ(s.mode, XmMode::Checksum);
}

TEST(SenderHandshake, TimesOutWithoutProbe) {
    auto cfg = quick_config();
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    XmSession s;

    EXPECT_EQ(n.await_probe(ch, s, nullptr), XmStatus::HandshakeTimeout);
    EXPECT_EQ(n.state(), XmNegotiator::State::AwaitingProbe);
    EXPECT_TRUE(ch.writes.empty());
}

TEST(SenderHandshake, TwoCansCancel) {
    auto cfg = quick_config();
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    ch.push({XM_CAN, XM_CAN, XM_CRC});
    XmSession s;

    EXPECT_EQ(n.await_probe(ch, s, nullptr), XmStatus::Cancelled);
}

TEST(SenderHandshake, SeparatedCansDoNotCancel) {
    auto cfg = quick_config();
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    ch.push({XM_CAN, 'z', XM_CAN, XM_NAK});
    XmSession s;

    EXPECT_EQ(n.await_probe(ch, s, nullptr), XmStatus::Ok);
    EXPECT_EQ(s.mode, XmMode::Checksum);
}

TEST(SenderHandshake, ExternalCancel) {
    auto cfg = quick_config();
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    ch.push_byte(XM_CRC);
    std::atomic<bool> cancel{true};
    XmSession s;

    EXPECT_EQ(n.await_probe(ch, s, &cancel), XmStatus::Cancelled);
}

TEST(ReceiverHandshake, CrcProbesThenFallsBackToNak) {
    auto cfg = quick_config();
    cfg.crc_fallback_after = 3;
    cfg.max_probes = 5;
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;

    while (n.probes_left()) ASSERT_TRUE(n.send_probe(ch));

    ASSERT_EQ(ch.writes.size(), 5u);
    EXPECT_EQ(ch.writes[0], std::vector<uint8_t>{XM_CRC});
    EXPECT_EQ(ch.writes[2], std::vector<uint8_t>{XM_CRC});
    EXPECT_EQ(ch.writes[3], std::vector<uint8_t>{XM_NAK});
    EXPECT_EQ(ch.writes[4], std::vector<uint8_t>{XM_NAK});
    EXPECT_EQ(n.probe_mode(), XmMode::Checksum);
    EXPECT_EQ(n.state(), XmNegotiator::State::ProbeSent);
    EXPECT_TRUE(n.crc_probed());
}

TEST(ReceiverHandshake, ChecksumPreferenceProbesNak) {
    auto cfg = quick_config();
    cfg.mode = XmMode::Checksum;
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;

    ASSERT_TRUE(n.send_probe(ch));
    EXPECT_EQ(ch.writes.front(), std::vector<uint8_t>{XM_NAK});
    EXPECT_FALSE(n.crc_probed());
}

TEST(ReceiverHandshake, ConfirmFixesModeOfLastProbe) {
    auto cfg = quick_config();
    cfg.crc_fallback_after = 0;
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    XmSession s;
    s.mode = XmMode::Checksum;

    EXPECT_EQ(n.state(), XmNegotiator::State::Idle);
    ASSERT_TRUE(n.send_probe(ch));
    ASSERT_TRUE(n.send_probe(ch));
    n.confirm(s);

    EXPECT_EQ(n.state(), XmNegotiator::State::Negotiated);
    EXPECT_EQ(s.mode, XmMode::Crc16);
    EXPECT_EQ(n.probes_sent(), 2);
}

TEST(ReceiverHandshake, ConfirmWithDecodedModeOverridesProbe) {
    auto cfg = quick_config();
    cfg.crc_fallback_after = 1;
    XmRetryPolicy policy(cfg);
    XmNegotiator n(cfg, policy);
    ScriptedChannel ch;
    XmSession s;

    ASSERT_TRUE(n.send_probe(ch));
    ASSERT_TRUE(n.send_probe(ch));
    ASSERT_EQ(n.probe_mode(), XmMode::Checksum);
    n.confirm(s, XmMode::Crc16);

    EXPECT_EQ(n.state(), XmNegotiator::State::Negotiated);
    EXPECT_EQ(s.mode, XmMode::Crc16);
    EXPECT_EQ(n.probe_mode(), XmMode::Crc16);
}
