#include "xm_protocol.h"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static bool parse_hex(const std::string& in, std::vector<uint8_t>& out) {
    std::string digits;
    for (char c : in) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        digits.push_back(c);
    }
    if (digits.size() % 2 != 0) return false;

    out.clear();
    for (size_t i = 0; i < digits.size(); i += 2) {
        out.push_back((uint8_t)std::stoul(digits.substr(i, 2), nullptr, 16));
    }
    return true;
}

static std::string hex(const uint8_t* p, size_t n) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (size_t i = 0; i < n; ++i) os << std::setw(2) << (int)p[i];
    return os.str();
}

static std::string hex8(unsigned v) {
    std::ostringstream os;
    os << "0x" << std::hex << std::setfill('0') << std::setw(2) << v;
    return os.str();
}

static std::string hex16(unsigned v) {
    std::ostringstream os;
    os << "0x" << std::hex << std::setfill('0') << std::setw(4) << v;
    return os.str();
}

// Prints the structure of one frame. Returns true if it decodes cleanly.
static bool analyze(const std::vector<uint8_t>& pkt) {
    if (pkt.size() < XM_HEADER_LEN + 1) {
        std::cout << "Packet too short\n";
        return false;
    }

    std::cout << "Packet length: " << pkt.size() << " bytes\n";

    uint8_t header = pkt[0];
    size_t block_size = xm_block_size_for(header);
    if (block_size == 0) {
        std::cout << "Header: " << hex8(header) << " (ERROR - should be 0x01 or 0x02)\n";
        block_size = XM_BLOCK_128;
    } else {
        std::cout << "Header: " << hex8(header) << " (" << (header == XM_SOH ? "SOH" : "STX")
                  << ", " << block_size << "-byte block)\n";
    }

    uint8_t num = pkt[1];
    uint8_t cmpl = pkt[2];
    std::cout << "Block number: " << (int)num << "\n";
    std::cout << "Block number complement: " << hex8(cmpl)
              << " (should be " << hex8(0xFFu - num) << ") "
              << (num + cmpl == 0xFF ? "OK" : "MISMATCH") << "\n";

    XmMode mode;
    if (pkt.size() == xm_frame_len(block_size, XmMode::Crc16)) {
        mode = XmMode::Crc16;
    } else if (pkt.size() == xm_frame_len(block_size, XmMode::Checksum)) {
        mode = XmMode::Checksum;
    } else {
        std::cout << "Unknown packet format - unexpected length: " << pkt.size()
                  << " (expected " << xm_frame_len(block_size, XmMode::Checksum)
                  << " or " << xm_frame_len(block_size, XmMode::Crc16) << ")\n";
        return false;
    }

    const uint8_t* data = pkt.data() + XM_HEADER_LEN;
    size_t preview = block_size < 16 ? block_size : 16;
    std::cout << "Data (" << block_size << " bytes): " << hex(data, preview) << "...\n";

    const uint8_t* trailer = data + block_size;
    if (mode == XmMode::Crc16) {
        unsigned got = (unsigned)((trailer[0] << 8) | trailer[1]);
        unsigned want = xm_crc16(data, block_size);
        std::cout << "CRC: " << hex16(got) << "\n"
                  << "Expected CRC: " << hex16(want) << "\n"
                  << "CRC: " << (got == want ? "OK" : "MISMATCH!") << "\n";
    } else {
        unsigned got = trailer[0];
        unsigned want = xm_checksum8(data, block_size);
        std::cout << "Checksum: " << hex8(got) << "\n"
                  << "Expected checksum: " << hex8(want) << "\n"
                  << "Checksum: " << (got == want ? "OK" : "MISMATCH!") << "\n";
    }

    XmBlock blk;
    FrameError err = xm_decode_frame(pkt.data(), pkt.size(), block_size, mode, blk);
    std::cout << "Verdict: " << (err == FrameError::None ? "valid " : "invalid ")
              << xm_mode_name(mode) << " frame";
    if (err != FrameError::None) std::cout << " (" << xm_frame_error_name(err) << ")";
    std::cout << "\n";
    return err == FrameError::None;
}

int main(int argc, char** argv) {
    if (argc != 2 || std::string(argv[1]) == "-h") {
        std::cerr << "Usage: " << argv[0] << " <hex_packet>\n"
                  << "Example: " << argv[0] << " '0101fe41...'\n";
        return 1;
    }

    std::vector<uint8_t> pkt;
    if (!parse_hex(argv[1], pkt)) {
        std::cerr << "Invalid hex string\n";
        return 1;
    }
    return analyze(pkt) ? 0 : 2;
}
