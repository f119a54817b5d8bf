#ifndef PBRPC_REQUEST_BUILDER_HPP
#define PBRPC_REQUEST_BUILDER_HPP

#include "config.hpp"
#include "packet.hpp"
#include "types.hpp"
#include <any>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pbrpc {

/// Call arguments, one std::any per declared parameter
using Arguments = std::vector<std::any>;

/// Serializes the single call argument into packet data
using ArgumentEncoder = std::function<Bytes(const std::any& argument)>;

/// Produces a log id for a call
using LogIdGenerator = std::function<int64_t(
    const std::string& service_name, const std::string& method_name, const Arguments& args)>;

/// Produces optional bytes for a call (attachment or authentication data)
using CallDataHandler = std::function<std::optional<Bytes>(
    const std::string& service_name, const std::string& method_name, const Arguments& args)>;

/// Client-side metadata of one remote method
struct MethodInfo {
    std::string service_name;
    std::string method_name;

    /// Encoder for the single argument (no data is sent when unset)
    ArgumentEncoder input_encoder;

    /// Declared compression tag
    CompressType compress_type = CompressType::NONE;

    /// Optional hooks
    LogIdGenerator log_id_generator;
    CallDataHandler attachment_handler;
    CallDataHandler authentication_data_handler;
};

/// Per-call context supplied by the caller
struct CallContext {
    /// When set, always used as the request log id
    std::optional<int64_t> log_id;
};

/// Build a request packet for method_info called with args
/// Only a call with exactly one argument carries data
/// Log id resolution: context.log_id, then the generator, then 0
/// Exceptions thrown by the encoder or the hooks propagate unchanged
Packet BuildRequest(const MethodInfo& method_info, const Arguments& args,
                    const CallContext& context = {},
                    const ProtocolConfig& config = {});

} // namespace pbrpc

#endif // PBRPC_REQUEST_BUILDER_HPP
