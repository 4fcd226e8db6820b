#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Control bytes
enum : uint8_t {
    XM_SOH  = 0x01, // 128-byte block header
    XM_STX  = 0x02, // 1024-byte block header
    XM_EOT  = 0x04,
    XM_ACK  = 0x06,
    XM_NAK  = 0x15,
    XM_CAN  = 0x18,
    XM_CRC  = 0x43, // 'C', CRC-mode probe
    XM_PAD  = 0x1A, // filler for the final short block
};

constexpr size_t XM_BLOCK_128  = 128;
constexpr size_t XM_BLOCK_1K   = 1024;
constexpr size_t XM_HEADER_LEN = 3; // header, block number, complement

enum class XmMode : uint8_t {
    Checksum,
    Crc16,
};

enum class FrameError : uint8_t {
    None,
    HeaderMismatch,
    BlockNumberCorrupt,
    LengthMismatch,
    IntegrityMismatch,
};

struct XmBlock {
    uint8_t number = 0;
    std::vector<uint8_t> payload;
};

// Integrity helpers
uint8_t  xm_checksum8(const uint8_t* data, size_t len);
uint16_t xm_crc16(const uint8_t* data, size_t len);

size_t xm_trailer_len(XmMode mode);
size_t xm_frame_len(size_t block_size, XmMode mode);

// Header byte for a payload size, or 0 if the size is not 128/1024.
uint8_t xm_header_for(size_t block_size);
// Payload size announced by a header byte, or 0 if it is not SOH/STX.
size_t xm_block_size_for(uint8_t header);

// Frame codec. Encoding throws std::invalid_argument unless the payload is
// exactly 128 or 1024 bytes; the caller pads the final block.
std::vector<uint8_t> xm_encode_frame(uint8_t block_number,
                                     const std::vector<uint8_t>& payload,
                                     XmMode mode);

FrameError xm_decode_frame(const uint8_t* frame, size_t len,
                           size_t expected_block_size, XmMode mode,
                           XmBlock& out);

const char* xm_frame_error_name(FrameError e);
const char* xm_mode_name(XmMode mode);
