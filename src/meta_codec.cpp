#include "pbrpc/meta.hpp"
#include "pbrpc/errors.hpp"
#include "rpc_meta.pb.h"
#include <climits>
#include <string>
#include <utility>

namespace pbrpc {

namespace {
    std::string ToString(const Bytes& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    void ToWire(const RequestMeta& request, wire::RpcRequestMeta* out) {
        out->set_service_name(request.service_name);
        out->set_method_name(request.method_name);
        out->set_log_id(request.log_id);
        out->set_trace_id(request.trace_id);
        out->set_span_id(request.span_id);
        out->set_parent_span_id(request.parent_span_id);
        if (!request.trace_key.empty()) {
            out->set_trace_key(request.trace_key);
        }
        for (const auto& field : request.ext_fields) {
            auto* ext = out->add_ext_fields();
            ext->set_key(field.key);
            ext->set_value(field.value);
        }
        if (!request.extra_param.empty()) {
            out->set_extra_param(ToString(request.extra_param));
        }
    }

    RequestMeta FromWire(const wire::RpcRequestMeta& in) {
        RequestMeta request;
        request.service_name = in.service_name();
        request.method_name = in.method_name();
        request.log_id = in.log_id();
        request.trace_id = in.trace_id();
        request.trace_key = in.trace_key();
        request.span_id = in.span_id();
        request.parent_span_id = in.parent_span_id();
        request.ext_fields.reserve(in.ext_fields_size());
        for (const auto& ext : in.ext_fields()) {
            request.ext_fields.push_back(ExtField{ext.key(), ext.value()});
        }
        const std::string& extra = in.extra_param();
        request.extra_param.assign(extra.begin(), extra.end());
        return request;
    }
}

Trace RequestMeta::GetTrace() const {
    Trace trace;
    trace.trace_id = trace_id;
    trace.trace_key = trace_key;
    trace.span_id = span_id;
    trace.parent_span_id = parent_span_id;
    return trace;
}

void RequestMeta::SetTrace(const Trace& trace) {
    trace_id = trace.trace_id;
    trace_key = trace.trace_key;
    span_id = trace.span_id;
    parent_span_id = trace.parent_span_id;
}

Bytes RpcMeta::Encode() const {
    wire::RpcMeta message;

    if (request) {
        ToWire(*request, message.mutable_request());
    }
    if (response) {
        auto* out = message.mutable_response();
        out->set_error_code(response->error_code);
        out->set_error_text(response->error_text);
    }
    message.set_compress_type(static_cast<int32_t>(compress_type));
    message.set_correlation_id(correlation_id);
    message.set_attachment_size(attachment_size);
    if (chunk_info) {
        auto* out = message.mutable_chunk_info();
        out->set_stream_id(chunk_info->stream_id);
        out->set_chunk_id(chunk_info->chunk_id);
    }
    if (authentication_data) {
        message.set_authentication_data(ToString(*authentication_data));
    }

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        throw FormatError("Failed to serialize RpcMeta");
    }
    return Bytes(serialized.begin(), serialized.end());
}

RpcMeta RpcMeta::Decode(const uint8_t* data, size_t size) {
    if (size > static_cast<size_t>(INT_MAX)) {
        throw FormatError("RpcMeta too large");
    }

    wire::RpcMeta message;
    if (!message.ParseFromArray(data, static_cast<int>(size))) {
        throw FormatError("Failed to parse RpcMeta");
    }

    RpcMeta meta;
    if (message.has_request()) {
        meta.request = FromWire(message.request());
    }
    if (message.has_response()) {
        ResponseMeta response;
        response.error_code = message.response().error_code();
        response.error_text = message.response().error_text();
        meta.response = std::move(response);
    }
    meta.compress_type = static_cast<CompressType>(message.compress_type());
    meta.correlation_id = message.correlation_id();
    meta.attachment_size = message.attachment_size();
    if (message.has_chunk_info()) {
        meta.chunk_info = ChunkInfo{message.chunk_info().stream_id(), message.chunk_info().chunk_id()};
    }
    if (message.has_authentication_data()) {
        const std::string& auth = message.authentication_data();
        meta.authentication_data = Bytes(auth.begin(), auth.end());
    }
    return meta;
}

bool operator==(const Trace& lhs, const Trace& rhs) {
    return lhs.trace_id == rhs.trace_id &&
           lhs.trace_key == rhs.trace_key &&
           lhs.span_id == rhs.span_id &&
           lhs.parent_span_id == rhs.parent_span_id;
}

bool operator==(const ExtField& lhs, const ExtField& rhs) {
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

bool operator==(const RequestMeta& lhs, const RequestMeta& rhs) {
    return lhs.service_name == rhs.service_name &&
           lhs.method_name == rhs.method_name &&
           lhs.log_id == rhs.log_id &&
           lhs.GetTrace() == rhs.GetTrace() &&
           lhs.ext_fields == rhs.ext_fields &&
           lhs.extra_param == rhs.extra_param;
}

bool operator==(const ResponseMeta& lhs, const ResponseMeta& rhs) {
    return lhs.error_code == rhs.error_code && lhs.error_text == rhs.error_text;
}

bool operator==(const ChunkInfo& lhs, const ChunkInfo& rhs) {
    return lhs.stream_id == rhs.stream_id && lhs.chunk_id == rhs.chunk_id;
}

bool operator==(const RpcMeta& lhs, const RpcMeta& rhs) {
    return lhs.request == rhs.request &&
           lhs.response == rhs.response &&
           lhs.compress_type == rhs.compress_type &&
           lhs.correlation_id == rhs.correlation_id &&
           lhs.attachment_size == rhs.attachment_size &&
           lhs.chunk_info == rhs.chunk_info &&
           lhs.authentication_data == rhs.authentication_data;
}

} // namespace pbrpc
