#include "xm_transfer.h"

bool xm_validate_config(const XmTransferConfig& cfg, std::string& why) {
    if (cfg.block_size != XM_BLOCK_128 && cfg.block_size != XM_BLOCK_1K) {
        why = "block size must be 128 or 1024";
        return false;
    }
    if (cfg.retries < 1) { why = "retries must be >= 1"; return false; }
    if (cfg.cancel_threshold < 1) { why = "cancel threshold must be >= 1"; return false; }
    if (cfg.timeout_ms <= 0 || cfg.initial_timeout_ms <= 0 || cfg.probe_interval_ms <= 0) {
        why = "timeouts must be positive";
        return false;
    }
    if (cfg.max_probes < 1) { why = "max probes must be >= 1"; return false; }
    if (cfg.pacing_ms < 0 || cfg.purge_ms < 0 || cfg.crc_fallback_after < 0) {
        why = "pacing, purge and fallback values must not be negative";
        return false;
    }
    if (cfg.purge_ms >= cfg.timeout_ms) {
        why = "purge period must be shorter than the timeout";
        return false;
    }
    return true;
}

const char* xm_status_name(XmStatus s) {
    switch (s) {
    case XmStatus::Ok:                 return "ok";
    case XmStatus::HandshakeTimeout:   return "handshake timeout";
    case XmStatus::RetryExhausted:     return "retries exhausted";
    case XmStatus::EotNotAcknowledged: return "EOT not acknowledged";
    case XmStatus::Cancelled:          return "cancelled";
    case XmStatus::NoData:             return "no data";
    case XmStatus::LinkError:          return "link error";
    case XmStatus::StreamError:        return "stream error";
    }
    return "unknown";
}
