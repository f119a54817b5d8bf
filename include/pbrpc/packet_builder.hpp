#ifndef PBRPC_PACKET_BUILDER_HPP
#define PBRPC_PACKET_BUILDER_HPP

#include "head.hpp"
#include "meta.hpp"
#include "packet.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace pbrpc {

/// Fluent builder for Packet
/// Request fields create the request meta, error fields create the response meta
/// Build() can be called repeatedly; each call returns an independent packet
class PacketBuilder {
public:
    PacketBuilder() = default;

    /// @throws ArgumentError if magic_code is not exactly 4 bytes
    PacketBuilder& MagicCode(const std::string& magic_code);

    PacketBuilder& ServiceName(const std::string& service_name);
    PacketBuilder& MethodName(const std::string& method_name);
    PacketBuilder& LogId(int64_t log_id);
    PacketBuilder& Trace(const pbrpc::Trace& trace);
    PacketBuilder& ExtField(const std::string& key, const std::string& value);
    PacketBuilder& ExtraParam(Bytes extra_param);

    PacketBuilder& ErrorCode(int32_t error_code);
    PacketBuilder& ErrorText(const std::string& error_text);

    PacketBuilder& CompressType(pbrpc::CompressType compress_type);
    PacketBuilder& CorrelationId(int64_t correlation_id);
    PacketBuilder& ChunkInfo(int64_t stream_id, int64_t chunk_id);
    PacketBuilder& AuthenticationData(Bytes authentication_data);

    PacketBuilder& Data(Bytes data);
    PacketBuilder& Attachment(Bytes attachment);
    PacketBuilder& Timestamp(int64_t timestamp);

    /// Create the packet
    Packet Build() const;

private:
    RpcMeta& MutableMeta();
    RequestMeta& MutableRequest();
    ResponseMeta& MutableResponse();

    std::optional<Head> head_;
    std::optional<RpcMeta> meta_;
    Bytes data_;
    Bytes attachment_;
    std::optional<int64_t> timestamp_;
};

} // namespace pbrpc

#endif // PBRPC_PACKET_BUILDER_HPP
