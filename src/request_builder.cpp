#include "pbrpc/request_builder.hpp"
#include "pbrpc/packet_builder.hpp"
#include <iostream>
#include <utility>

namespace pbrpc {

Packet BuildRequest(const MethodInfo& method_info, const Arguments& args,
                    const CallContext& context, const ProtocolConfig& config) {
    const std::string& service_name = method_info.service_name;
    const std::string& method_name = method_info.method_name;

    PacketBuilder builder;
    builder.MagicCode(config.magic_code)
           .ServiceName(service_name)
           .MethodName(method_name)
           .CompressType(method_info.compress_type);

    // Only single-argument calls carry data
    if (args.size() == 1 && method_info.input_encoder) {
        builder.Data(method_info.input_encoder(args.front()));
    }

    // Resolve log id: call context, then generator, otherwise left at 0
    if (context.log_id) {
        if (config.log_id_override_notice) {
            std::cerr << "Call context carries log id " << *context.log_id
                      << ", using it for " << service_name << "." << method_name << std::endl;
        }
        builder.LogId(*context.log_id);
    } else if (method_info.log_id_generator) {
        builder.LogId(method_info.log_id_generator(service_name, method_name, args));
    }

    if (method_info.attachment_handler) {
        std::optional<Bytes> attachment = method_info.attachment_handler(service_name, method_name, args);
        if (attachment) {
            builder.Attachment(std::move(*attachment));
        }
    }

    if (method_info.authentication_data_handler) {
        std::optional<Bytes> authentication_data =
            method_info.authentication_data_handler(service_name, method_name, args);
        if (authentication_data) {
            builder.AuthenticationData(std::move(*authentication_data));
        }
    }

    return builder.Build();
}

} // namespace pbrpc
