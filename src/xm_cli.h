#pragma once

#include "XmSerialChannel.h"
#include "xm_transfer.h"

#include <atomic>
#include <string>

// Upper bound for --timeout. The handshake window is ten times this and must fit an int of ms.
constexpr double XM_MAX_TIMEOUT_S = 3600.0;

// Options shared by xmsend and xmrecv.
struct XmCliArgs {
    XmSerialArgs serial;
    XmTransferConfig xfer;
};

// Consumes argv[i] (and its value) if it is a common option.
// Returns 1 if consumed, 0 if not a common option, -1 on a bad value.
int xm_parse_common(int argc, char** argv, int& i, XmCliArgs& a);

const char* xm_common_usage();

std::string xm_human(double n);

// SIGINT sets the returned flag; the engine polls it once per step.
const std::atomic<bool>* xm_install_interrupt();
bool xm_interrupted();
