#ifndef PBRPC_CONFIG_HPP
#define PBRPC_CONFIG_HPP

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace pbrpc {

/// Protocol-level settings shared by the request builder, the chunk
/// assembler and frame peeking
struct ProtocolConfig {
    /// Magic code written into request heads (default: "PRPC")
    std::string magic_code = protocol::MAGIC_CODE;

    /// Data size per chunk when encoding for transmission (0 = never split)
    int64_t chunk_size = 0;

    /// Largest accepted frame body / reassembled payload (default: 512MB)
    uint32_t max_body_size = protocol::MAX_BODY_SIZE;

    /// Maximum number of chunk streams reassembled at once (default: 1024)
    size_t max_pending_streams = 1024;

    /// Print a notice when a call-context log id overrides the generator
    bool log_id_override_notice = false;
};

} // namespace pbrpc

#endif // PBRPC_CONFIG_HPP
