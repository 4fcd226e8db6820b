#include "XmReceiver.h"
#include "XmSerialChannel.h"
#include "xm_cli.h"

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using Clock = std::chrono::steady_clock;

struct RecvCliArgs {
    XmCliArgs common;
    std::string out_path;
    bool force = false;
};

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --port DEV --out PATH [--force] [--checksum] [options]\n"
              << xm_common_usage()
              << "  --out, -o PATH     output file\n"
              << "  --force, -f        overwrite PATH if it exists\n"
              << "  --checksum         ask for 8-bit checksum mode instead of CRC-16\n";
}

static bool parse_args(int argc, char** argv, RecvCliArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "-h" || s == "--help") { usage(argv[0]); return false; }

        int r = xm_parse_common(argc, argv, i, a.common);
        if (r < 0) { usage(argv[0]); return false; }
        if (r > 0) continue;

        if ((s == "--out" || s == "-o") && i + 1 < argc) a.out_path = argv[++i];
        else if (s == "--force" || s == "-f") a.force = true;
        else if (s == "--checksum") a.common.xfer.mode = XmMode::Checksum;
        else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
    }

    if (a.common.serial.device.empty()) { std::cerr << "--port is required\n"; usage(argv[0]); return false; }
    if (a.out_path.empty()) { std::cerr << "--out is required\n"; usage(argv[0]); return false; }

    std::string why;
    if (!xm_validate_config(a.common.xfer, why)) { std::cerr << why << "\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    RecvCliArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    if (::access(args.out_path.c_str(), F_OK) == 0 && !args.force) {
        std::cerr << "Refusing to overwrite existing file: " << args.out_path << " (use --force)\n";
        return 3;
    }

    XmSerialChannel ch(args.common.serial);
    if (!ch.init()) return 4;

    std::string tmp = args.out_path + ".part";
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) { std::cerr << "Failed to open " << tmp << "\n"; return 4; }

    XmTransferHooks hooks;
    hooks.cancel = xm_install_interrupt();
    hooks.progress = [&](uint64_t got) {
        std::cerr << "\rReceiving -> " << args.out_path << "  " << xm_human((double)got) << std::flush;
    };

    auto start = Clock::now();
    XmResult r = xm_receive(ch, ofs, args.common.xfer, hooks);
    ofs.close();
    double secs = std::chrono::duration<double>(Clock::now() - start).count();
    if (secs < 1e-6) secs = 1e-6;
    std::cerr << "\n";

    if (!r.ok() || r.bytes == 0 || !ofs) {
        if (std::remove(tmp.c_str()) != 0) perror(tmp.c_str());
        if (xm_interrupted()) {
            std::cerr << "Interrupted.\n";
            return 130;
        }
        std::cerr << "Receive failed (" << xm_status_name(r.status) << ", "
                  << r.bytes << " bytes)\n";
        return 4;
    }

    if (std::rename(tmp.c_str(), args.out_path.c_str()) != 0) {
        perror("rename");
        return 4;
    }

    std::cout << "Received " << xm_human((double)r.bytes) << " in " << secs << "s  (~"
              << xm_human((double)r.bytes / secs) << "/s)\n";
    return 0;
}
