#include "packet_codec.hpp"
#include "pbrpc/errors.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace pbrpc {
namespace internal {

namespace {
    constexpr size_t MAX_INT32_SIZE = static_cast<size_t>(std::numeric_limits<int32_t>::max());

    void CheckRemaining(size_t offset, size_t needed, size_t size, const char* what) {
        if (needed > size - offset) {
            throw FormatError(std::string("Incomplete ") + what);
        }
    }
}

Bytes PacketCodec::Encode(Head& head, RpcMeta& meta, const Bytes& data, const Bytes& attachment) {
    if (attachment.size() > MAX_INT32_SIZE) {
        throw FormatError("Attachment too large");
    }
    meta.attachment_size = static_cast<int32_t>(attachment.size());

    Bytes meta_bytes = meta.Encode();

    // TotalSize covers Meta + Data + Attachment, not the head
    size_t total_size = meta_bytes.size() + data.size() + attachment.size();
    if (total_size > MAX_INT32_SIZE) {
        throw FormatError("Packet body too large");
    }
    head.SetMetaSize(static_cast<int32_t>(meta_bytes.size()));
    head.SetTotalSize(static_cast<int32_t>(total_size));

    Bytes buffer;
    buffer.reserve(protocol::HEAD_SIZE + total_size);

    head.EncodeTo(buffer);
    buffer.insert(buffer.end(), meta_bytes.begin(), meta_bytes.end());
    buffer.insert(buffer.end(), data.begin(), data.end());
    buffer.insert(buffer.end(), attachment.begin(), attachment.end());

    return buffer;
}

Frame PacketCodec::Decode(const uint8_t* data, size_t size) {
    if (data == nullptr) {
        throw ArgumentError("Packet data is null");
    }

    Frame frame;

    // Read Head (12 bytes)
    frame.head = Head::Decode(data, size);
    size_t offset = protocol::HEAD_SIZE;

    // Read Meta (MetaSize bytes)
    int32_t meta_size = frame.head.GetMetaSize();
    if (meta_size < 0) {
        throw FormatError("Negative meta size");
    }
    CheckRemaining(offset, static_cast<size_t>(meta_size), size, "meta");
    frame.meta = RpcMeta::Decode(data + offset, static_cast<size_t>(meta_size));
    offset += static_cast<size_t>(meta_size);

    int32_t attachment_size = frame.meta.attachment_size;
    if (attachment_size < 0) {
        throw FormatError("Negative attachment size");
    }

    // DataSize = TotalSize - MetaSize - AttachmentSize
    int64_t data_size = static_cast<int64_t>(frame.head.GetTotalSize()) - meta_size - attachment_size;
    if (data_size < 0) {
        throw FormatError("Negative data size");
    }

    // Read Data
    if (data_size > 0) {
        CheckRemaining(offset, static_cast<size_t>(data_size), size, "data");
        frame.data.assign(data + offset, data + offset + data_size);
        offset += static_cast<size_t>(data_size);
    }

    // Read Attachment
    if (attachment_size > 0) {
        CheckRemaining(offset, static_cast<size_t>(attachment_size), size, "attachment");
        frame.attachment.assign(data + offset, data + offset + attachment_size);
    }

    return frame;
}

} // namespace internal
} // namespace pbrpc
