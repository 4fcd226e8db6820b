#include "xm_cli.h"

#include <signal.h>

#include <cstdio>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) {
    g_interrupted.store(true);
}

} // namespace

int xm_parse_common(int argc, char** argv, int& i, XmCliArgs& a) {
    std::string s = argv[i];
    auto value = [&]() -> const char* {
        if (i + 1 >= argc) {
            std::cerr << s << " needs a value\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        if (s == "--port" || s == "-p") {
            const char* v = value(); if (!v) return -1;
            a.serial.device = v;
        } else if (s == "--baud" || s == "-b") {
            const char* v = value(); if (!v) return -1;
            a.serial.baud = std::stoi(v);
        } else if (s == "--timeout") {
            const char* v = value(); if (!v) return -1;
            double secs = std::stod(v);
            if (!(secs > 0 && secs <= XM_MAX_TIMEOUT_S)) {
                std::cerr << "--timeout must be in (0, " << XM_MAX_TIMEOUT_S << "] seconds\n";
                return -1;
            }
            a.xfer.timeout_ms = (int)(secs * 1000.0);
            a.xfer.probe_interval_ms = a.xfer.timeout_ms;
            // The other side may still be starting up.
            a.xfer.initial_timeout_ms = a.xfer.timeout_ms * 10;
        } else if (s == "--retry") {
            const char* v = value(); if (!v) return -1;
            a.xfer.retries = std::stoi(v);
            a.xfer.max_probes = a.xfer.retries;
        } else if (s == "--rtscts") {
            a.serial.rtscts = true;
        } else if (s == "--1k") {
            a.xfer.block_size = XM_BLOCK_1K;
        } else if (s == "--debug") {
            a.serial.debug = true;
        } else if (s == "--verbose" || s == "-v") {
            a.xfer.verbose = true;
        } else {
            return 0;
        }
    } catch (const std::exception&) {
        std::cerr << "Bad value for " << s << "\n";
        return -1;
    }
    return 1;
}

const char* xm_common_usage() {
    return "  --port, -p DEV     serial device (e.g. /dev/ttyUSB0)\n"
           "  --baud, -b N       baud rate (default 115200)\n"
           "  --timeout S        read/write timeout in seconds (default 3.0)\n"
           "  --retry N          retries per block (default 16)\n"
           "  --rtscts           RTS/CTS hardware flow control\n"
           "  --1k               XMODEM-1k (1024-byte blocks)\n"
           "  --debug            hex-dump serial traffic\n"
           "  --verbose, -v      log every block\n";
}

std::string xm_human(double n) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    for (const char* u : units) {
        if (n < 1024.0) {
            os << n << " " << u;
            return os.str();
        }
        n /= 1024.0;
    }
    os << n << " TB";
    return os.str();
}

const std::atomic<bool>* xm_install_interrupt() {
    struct sigaction sa{};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: let poll() return early
    if (sigaction(SIGINT, &sa, nullptr) < 0) perror("sigaction SIGINT");
    return &g_interrupted;
}

bool xm_interrupted() {
    return g_interrupted.load();
}
