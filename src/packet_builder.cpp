#include "pbrpc/packet_builder.hpp"
#include <utility>

namespace pbrpc {

RpcMeta& PacketBuilder::MutableMeta() {
    if (!meta_) {
        meta_.emplace();
    }
    return *meta_;
}

RequestMeta& PacketBuilder::MutableRequest() {
    RpcMeta& meta = MutableMeta();
    if (!meta.request) {
        meta.request.emplace();
    }
    return *meta.request;
}

ResponseMeta& PacketBuilder::MutableResponse() {
    RpcMeta& meta = MutableMeta();
    if (!meta.response) {
        meta.response.emplace();
    }
    return *meta.response;
}

PacketBuilder& PacketBuilder::MagicCode(const std::string& magic_code) {
    if (!head_) {
        head_.emplace();
    }
    head_->SetMagicCode(magic_code);
    return *this;
}

PacketBuilder& PacketBuilder::ServiceName(const std::string& service_name) {
    MutableRequest().service_name = service_name;
    return *this;
}

PacketBuilder& PacketBuilder::MethodName(const std::string& method_name) {
    MutableRequest().method_name = method_name;
    return *this;
}

PacketBuilder& PacketBuilder::LogId(int64_t log_id) {
    MutableRequest().log_id = log_id;
    return *this;
}

PacketBuilder& PacketBuilder::Trace(const pbrpc::Trace& trace) {
    MutableRequest().SetTrace(trace);
    return *this;
}

PacketBuilder& PacketBuilder::ExtField(const std::string& key, const std::string& value) {
    MutableRequest().ext_fields.push_back(pbrpc::ExtField{key, value});
    return *this;
}

PacketBuilder& PacketBuilder::ExtraParam(Bytes extra_param) {
    MutableRequest().extra_param = std::move(extra_param);
    return *this;
}

PacketBuilder& PacketBuilder::ErrorCode(int32_t error_code) {
    MutableResponse().error_code = error_code;
    return *this;
}

PacketBuilder& PacketBuilder::ErrorText(const std::string& error_text) {
    MutableResponse().error_text = error_text;
    return *this;
}

PacketBuilder& PacketBuilder::CompressType(pbrpc::CompressType compress_type) {
    MutableMeta().compress_type = compress_type;
    return *this;
}

PacketBuilder& PacketBuilder::CorrelationId(int64_t correlation_id) {
    MutableMeta().correlation_id = correlation_id;
    return *this;
}

PacketBuilder& PacketBuilder::ChunkInfo(int64_t stream_id, int64_t chunk_id) {
    MutableMeta().chunk_info = pbrpc::ChunkInfo{stream_id, chunk_id};
    return *this;
}

PacketBuilder& PacketBuilder::AuthenticationData(Bytes authentication_data) {
    MutableMeta().authentication_data = std::move(authentication_data);
    return *this;
}

PacketBuilder& PacketBuilder::Data(Bytes data) {
    data_ = std::move(data);
    return *this;
}

PacketBuilder& PacketBuilder::Attachment(Bytes attachment) {
    attachment_ = std::move(attachment);
    return *this;
}

PacketBuilder& PacketBuilder::Timestamp(int64_t timestamp) {
    timestamp_ = timestamp;
    return *this;
}

Packet PacketBuilder::Build() const {
    Packet packet(head_, meta_, data_, attachment_);
    if (timestamp_) {
        packet.SetTimestamp(*timestamp_);
    }
    return packet;
}

} // namespace pbrpc
