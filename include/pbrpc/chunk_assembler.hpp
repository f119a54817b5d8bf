#ifndef PBRPC_CHUNK_ASSEMBLER_HPP
#define PBRPC_CHUNK_ASSEMBLER_HPP

#include "config.hpp"
#include "packet.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>

namespace pbrpc {

/// Reassembles chunk streams produced by Packet::Split
/// Chunks of one stream must be fed in transmission order; streams may interleave
/// A stream is only reassembled from its chunk 0; chunks of a stream whose start
/// was missed, evicted or rejected as oversized are dropped up to its terminal chunk
/// Not thread-safe: use one assembler per receiving context
class ChunkAssembler {
public:
    explicit ChunkAssembler(const ProtocolConfig& config = {});

    /// Feed one received packet
    /// The assembled packet keeps head and meta of chunk 0, and the attachment of
    /// the first chunk that carried one
    /// @return the packet itself if it is not chunked, the assembled packet
    ///         (chunk info cleared) on a terminal chunk, std::nullopt otherwise
    /// @throws FormatError if a stream grows beyond config.max_body_size
    std::optional<Packet> Feed(Packet packet);

    /// Number of streams waiting for their terminal chunk
    size_t PendingCount() const;

    /// Drop all pending streams
    void Clear();

private:
    void EvictOldest();
    void Discard(int64_t stream_id);
    void ForgetDiscarded(int64_t stream_id);

    ProtocolConfig config_;
    std::map<int64_t, Packet> pending_;
    std::deque<int64_t> order_;  // Stream ids in arrival order of their first chunk
    std::set<int64_t> discarded_;
    std::deque<int64_t> discarded_order_;
};

} // namespace pbrpc

#endif // PBRPC_CHUNK_ASSEMBLER_HPP
