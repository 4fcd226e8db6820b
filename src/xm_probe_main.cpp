#include "XmSerialChannel.h"
#include "xm_cli.h"
#include "xm_probe.h"

#include <iostream>
#include <string>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --port DEV [options]\n"
              << "  --port, -p DEV     serial device to test\n"
              << "  --baud, -b N       baud rate (default 115200)\n"
              << "  --timeout S        read timeout in seconds (default 3.0)\n"
              << "  --rtscts           RTS/CTS hardware flow control\n"
              << "  --monitor          print incoming data until Ctrl+C\n"
              << "  --debug            hex-dump serial traffic\n";
}

static bool parse_args(int argc, char** argv, XmProbeArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) { std::cerr << name << " needs a value\n"; return nullptr; }
            return argv[++i];
        };
        try {
            if (s == "--port" || s == "-p") {
                const char* v = need("--port"); if (!v) return false;
                a.serial.device = v;
            } else if (s == "--baud" || s == "-b") {
                const char* v = need("--baud"); if (!v) return false;
                a.serial.baud = std::stoi(v);
            } else if (s == "--timeout") {
                const char* v = need("--timeout"); if (!v) return false;
                double secs = std::stod(v);
                if (!(secs > 0 && secs <= XM_MAX_TIMEOUT_S)) {
                    std::cerr << "--timeout must be in (0, " << XM_MAX_TIMEOUT_S << "] seconds\n";
                    return false;
                }
                a.timeout_ms = (int)(secs * 1000.0);
            } else if (s == "--rtscts") {
                a.serial.rtscts = true;
            } else if (s == "--monitor") {
                a.monitor = true;
            } else if (s == "--debug") {
                a.serial.debug = true;
            } else if (s == "-h" || s == "--help") {
                usage(argv[0]);
                return false;
            } else {
                std::cerr << "Unknown arg: " << s << "\n";
                usage(argv[0]);
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Bad value for " << s << "\n";
            return false;
        }
    }
    if (a.serial.device.empty()) { std::cerr << "--port is required\n"; usage(argv[0]); return false; }
    return true;
}

int main(int argc, char** argv) {
    XmProbeArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    XmSerialChannel ch(args.serial);
    if (!ch.init()) return 2;

    if (args.monitor) {
        xm_probe_monitor(ch, args, *xm_install_interrupt(), std::cout);
        return 0;
    }
    return xm_probe_test(ch, args, std::cout);
}
