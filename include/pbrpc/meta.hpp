#ifndef PBRPC_META_HPP
#define PBRPC_META_HPP

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pbrpc {

/// Tracing context of a request
struct Trace {
    int64_t trace_id = 0;
    std::string trace_key;
    int64_t span_id = 0;
    int64_t parent_span_id = 0;
};

/// Request meta extension field
struct ExtField {
    std::string key;
    std::string value;
};

struct RequestMeta {
    std::string service_name;
    std::string method_name;
    int64_t log_id = 0;
    int64_t trace_id = 0;
    std::string trace_key;
    int64_t span_id = 0;
    int64_t parent_span_id = 0;
    std::vector<ExtField> ext_fields;
    Bytes extra_param;

    /// Project the tracing fields
    Trace GetTrace() const;

    /// Overwrite the tracing fields
    void SetTrace(const Trace& trace);
};

struct ResponseMeta {
    int32_t error_code = 0;
    std::string error_text;
};

/// Chunk position inside a chunk stream
/// chunk_id is 0, 1, 2, ... in transmission order; protocol::FINAL_CHUNK_ID ends the stream
struct ChunkInfo {
    int64_t stream_id = 0;
    int64_t chunk_id = 0;

    bool IsFinal() const { return chunk_id == protocol::FINAL_CHUNK_ID; }
};

/// Packet meta, carried on the wire as a protobuf RpcMeta message
/// Request and response are mutually exclusive roles
struct RpcMeta {
    std::optional<RequestMeta> request;
    std::optional<ResponseMeta> response;
    CompressType compress_type = CompressType::NONE;
    int64_t correlation_id = 0;
    int32_t attachment_size = 0;
    std::optional<ChunkInfo> chunk_info;
    std::optional<Bytes> authentication_data;

    /// Serialize to protobuf wire format
    /// @throws FormatError if serialization fails
    Bytes Encode() const;

    /// Parse from protobuf wire format
    /// @throws FormatError if the bytes are not a valid RpcMeta
    static RpcMeta Decode(const uint8_t* data, size_t size);
};

bool operator==(const Trace& lhs, const Trace& rhs);
bool operator==(const ExtField& lhs, const ExtField& rhs);
bool operator==(const RequestMeta& lhs, const RequestMeta& rhs);
bool operator==(const ResponseMeta& lhs, const ResponseMeta& rhs);
bool operator==(const ChunkInfo& lhs, const ChunkInfo& rhs);
bool operator==(const RpcMeta& lhs, const RpcMeta& rhs);

inline bool operator!=(const RpcMeta& lhs, const RpcMeta& rhs) {
    return !(lhs == rhs);
}

} // namespace pbrpc

#endif // PBRPC_META_HPP
