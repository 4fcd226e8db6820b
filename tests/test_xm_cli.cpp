#include "xm_cli.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

// Runs xm_parse_common over args the way the mains do and returns the last result.
int parse(std::vector<std::string> args, XmCliArgs& a) {
    args.insert(args.begin(), "xmsend");
    std::vector<char*> argv;
    for (auto& s : args) argv.push_back(&s[0]);

    int r = 0;
    for (int i = 1; i < (int)argv.size(); ++i) {
        r = xm_parse_common((int)argv.size(), argv.data(), i, a);
        if (r <= 0) break;
    }
    return r;
}

} // namespace

TEST(CommonArgs, TimeoutSetsAllWindows) {
    XmCliArgs a;

    ASSERT_EQ(parse({"--timeout", "1.5"}, a), 1);
    EXPECT_EQ(a.xfer.timeout_ms, 1500);
    EXPECT_EQ(a.xfer.probe_interval_ms, 1500);
    EXPECT_EQ(a.xfer.initial_timeout_ms, 15000);
}

TEST(CommonArgs, LargestTimeoutFitsInt) {
    XmCliArgs a;

    ASSERT_EQ(parse({"--timeout", "3600"}, a), 1);
    EXPECT_EQ(a.xfer.timeout_ms, 3600000);
    EXPECT_EQ(a.xfer.initial_timeout_ms, 36000000);
}

TEST(CommonArgs, RejectsOutOfRangeTimeout) {
    for (const char* v : {"0", "-2", "3601", "1e12", "nan", "abc"}) {
        XmCliArgs a;
        EXPECT_EQ(parse({"--timeout", v}, a), -1) << v;
        EXPECT_EQ(a.xfer.timeout_ms, XmTransferConfig{}.timeout_ms) << v;
    }
}

TEST(CommonArgs, PortBaudRetryAndFlags) {
    XmCliArgs a;

    ASSERT_EQ(parse({"-p", "/dev/ttyUSB1", "-b", "9600", "--retry", "4", "--1k", "-v"}, a), 1);
    EXPECT_EQ(a.serial.device, "/dev/ttyUSB1");
    EXPECT_EQ(a.serial.baud, 9600);
    EXPECT_EQ(a.xfer.retries, 4);
    EXPECT_EQ(a.xfer.max_probes, 4);
    EXPECT_EQ(a.xfer.block_size, XM_BLOCK_1K);
    EXPECT_TRUE(a.xfer.verbose);
}

TEST(CommonArgs, MissingValueAndUnknownOption) {
    XmCliArgs a;
    EXPECT_EQ(parse({"--baud"}, a), -1);

    XmCliArgs b;
    EXPECT_EQ(parse({"--out"}, b), 0);
}
