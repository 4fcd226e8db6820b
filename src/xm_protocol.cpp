#include "xm_protocol.h"

#include <stdexcept>
#include <string>

uint8_t xm_checksum8(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; ++i) sum += data[i];
    return static_cast<uint8_t>(sum & 0xFFu);
}

uint16_t xm_crc16(const uint8_t* data, size_t len) {
    // CRC-16/XMODEM: poly 0x1021, init 0, no final xor, MSB first
    uint16_t crc = 0;
    for (size_t i = 0; i < len; ++i) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000u) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021u);
            else               crc = static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

size_t xm_trailer_len(XmMode mode) {
    return mode == XmMode::Crc16 ? 2 : 1;
}

size_t xm_frame_len(size_t block_size, XmMode mode) {
    return XM_HEADER_LEN + block_size + xm_trailer_len(mode);
}

uint8_t xm_header_for(size_t block_size) {
    if (block_size == XM_BLOCK_128) return XM_SOH;
    if (block_size == XM_BLOCK_1K) return XM_STX;
    return 0;
}

size_t xm_block_size_for(uint8_t header) {
    if (header == XM_SOH) return XM_BLOCK_128;
    if (header == XM_STX) return XM_BLOCK_1K;
    return 0;
}

std::vector<uint8_t> xm_encode_frame(uint8_t block_number,
                                     const std::vector<uint8_t>& payload,
                                     XmMode mode) {
    uint8_t header = xm_header_for(payload.size());
    if (header == 0) {
        throw std::invalid_argument("xm_encode_frame: payload must be 128 or 1024 bytes, got " +
                                    std::to_string(payload.size()));
    }

    std::vector<uint8_t> frame;
    frame.reserve(xm_frame_len(payload.size(), mode));
    frame.push_back(header);
    frame.push_back(block_number);
    frame.push_back(static_cast<uint8_t>(0xFF - block_number));
    frame.insert(frame.end(), payload.begin(), payload.end());

    if (mode == XmMode::Crc16) {
        uint16_t crc = xm_crc16(payload.data(), payload.size());
        frame.push_back(static_cast<uint8_t>(crc >> 8));
        frame.push_back(static_cast<uint8_t>(crc & 0xFF));
    } else {
        frame.push_back(xm_checksum8(payload.data(), payload.size()));
    }
    return frame;
}

FrameError xm_decode_frame(const uint8_t* frame, size_t len,
                           size_t expected_block_size, XmMode mode,
                           XmBlock& out) {
    if (len < XM_HEADER_LEN) return FrameError::LengthMismatch;

    uint8_t header = frame[0];
    if (header != xm_header_for(expected_block_size)) return FrameError::HeaderMismatch;

    uint8_t num = frame[1];
    uint8_t cmpl = frame[2];
    if (static_cast<unsigned>(num) + cmpl != 0xFFu) return FrameError::BlockNumberCorrupt;

    if (len != xm_frame_len(expected_block_size, mode)) return FrameError::LengthMismatch;

    const uint8_t* payload = frame + XM_HEADER_LEN;
    const uint8_t* trailer = payload + expected_block_size;
    if (mode == XmMode::Crc16) {
        uint16_t got = static_cast<uint16_t>((trailer[0] << 8) | trailer[1]);
        if (got != xm_crc16(payload, expected_block_size)) return FrameError::IntegrityMismatch;
    } else {
        if (trailer[0] != xm_checksum8(payload, expected_block_size)) return FrameError::IntegrityMismatch;
    }

    out.number = num;
    out.payload.assign(payload, payload + expected_block_size);
    return FrameError::None;
}

const char* xm_frame_error_name(FrameError e) {
    switch (e) {
    case FrameError::None:               return "none";
    case FrameError::HeaderMismatch:     return "header mismatch";
    case FrameError::BlockNumberCorrupt: return "block number corrupt";
    case FrameError::LengthMismatch:     return "length mismatch";
    case FrameError::IntegrityMismatch:  return "integrity mismatch";
    }
    return "unknown";
}

const char* xm_mode_name(XmMode mode) {
    return mode == XmMode::Crc16 ? "crc16" : "checksum";
}
