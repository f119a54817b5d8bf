#ifndef PBRPC_PACKET_CODEC_HPP
#define PBRPC_PACKET_CODEC_HPP

#include "pbrpc/head.hpp"
#include "pbrpc/meta.hpp"
#include "pbrpc/types.hpp"
#include <cstddef>

namespace pbrpc {
namespace internal {

/// Decoded parts of one packet
struct Frame {
    Head head;
    RpcMeta meta;
    Bytes data;
    Bytes attachment;
};

/// PacketCodec handles encoding and decoding of the Head | Meta | Data | Attachment layout
class PacketCodec {
public:
    /// Encode a packet to bytes
    /// Format: Head(12) + Meta(MetaSize) + Data(TotalSize - MetaSize - AttachmentSize) + Attachment(AttachmentSize)
    /// Writes the computed sizes back into meta and head
    static Bytes Encode(Head& head, RpcMeta& meta, const Bytes& data, const Bytes& attachment);

    /// Decode a packet from bytes, every part bounds-checked against size
    static Frame Decode(const uint8_t* data, size_t size);
};

} // namespace internal
} // namespace pbrpc

#endif // PBRPC_PACKET_CODEC_HPP
