#include "XmSender.h"
#include "XmSerialChannel.h"
#include "xm_cli.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

using Clock = std::chrono::steady_clock;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --port DEV [options] FILE\n"
              << xm_common_usage();
}

static bool parse_args(int argc, char** argv, XmCliArgs& a, std::string& file) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "-h" || s == "--help") { usage(argv[0]); return false; }

        int r = xm_parse_common(argc, argv, i, a);
        if (r < 0) { usage(argv[0]); return false; }
        if (r > 0) continue;

        if (!s.empty() && s[0] == '-') {
            std::cerr << "Unknown arg: " << s << "\n";
            usage(argv[0]);
            return false;
        }
        if (!file.empty()) { std::cerr << "Only one FILE may be sent\n"; return false; }
        file = s;
    }

    if (a.serial.device.empty()) { std::cerr << "--port is required\n"; usage(argv[0]); return false; }
    if (file.empty()) { std::cerr << "FILE is required\n"; usage(argv[0]); return false; }

    std::string why;
    if (!xm_validate_config(a.xfer, why)) { std::cerr << why << "\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    XmCliArgs args;
    std::string file;
    if (!parse_args(argc, argv, args, file)) return 1;

    std::ifstream f(file, std::ios::binary);
    if (!f) { std::cerr << "Failed to open file: " << file << "\n"; return 1; }
    // FIFOs and process substitutions cannot seek; send those without a size.
    std::optional<uint64_t> size;
    std::streampos end = f.seekg(0, std::ios::end).tellg();
    if (f && end != std::streampos(-1)) {
        size = (uint64_t)end;
        if (!f.seekg(0, std::ios::beg)) {
            std::cerr << "Failed to rewind file: " << file << "\n";
            return 1;
        }
    } else {
        f.clear();
    }

    XmSerialChannel ch(args.serial);
    if (!ch.init()) return 2;
    ch.drain_input();

    XmTransferHooks hooks;
    hooks.cancel = xm_install_interrupt();
    hooks.file_size = size;
    hooks.progress = [&](uint64_t sent) {
        if (!size) {
            std::cerr << "\rSending " << file << "  " << xm_human((double)sent) << std::flush;
            return;
        }
        double pct = *size ? (100.0 * (double)sent / (double)*size) : 100.0;
        std::cerr << "\rSending " << file << "  " << (int)pct << "%  ("
                  << xm_human((double)sent) << "/" << xm_human((double)*size) << ")" << std::flush;
    };

    std::cerr << "Waiting for receiver to initiate transfer...\n";
    auto start = Clock::now();
    XmResult r = xm_send(ch, f, args.xfer, hooks);
    double secs = std::chrono::duration<double>(Clock::now() - start).count();
    if (secs < 1e-6) secs = 1e-6;
    std::cerr << "\n";

    if (xm_interrupted()) {
        std::cerr << "Interrupted.\n";
        return 130;
    }
    if (!r.ok()) {
        std::cerr << "Transfer failed (" << xm_status_name(r.status) << ") after "
                  << xm_human((double)r.bytes) << "\n";
        return 2;
    }

    std::cout << "Sent " << xm_human((double)r.bytes) << " in " << secs << "s  (~"
              << xm_human((double)r.bytes / secs) << "/s)\n";
    return 0;
}
