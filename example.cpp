// Example usage of the pbrpc packet library
// Builds a request, splits it for transmission and reassembles it on the receiving side

#include <pbrpc/chunk_assembler.hpp>
#include <pbrpc/errors.hpp>
#include <pbrpc/packet.hpp>
#include <pbrpc/request_builder.hpp>
#include <iostream>
#include <string>

int main() {
    using namespace pbrpc;

    // 1. Describe the remote method
    MethodInfo method_info;
    method_info.service_name = "EchoService";
    method_info.method_name = "echo";
    method_info.input_encoder = [](const std::any& argument) {
        const std::string& text = std::any_cast<const std::string&>(argument);
        return Bytes(text.begin(), text.end());
    };
    method_info.attachment_handler = [](const std::string&, const std::string&, const Arguments&) {
        return std::optional<Bytes>(Bytes{'a', 't', 't'});
    };

    // 2. Configure chunking
    ProtocolConfig config;
    config.chunk_size = 8;

    // 3. Build the request for one call
    CallContext context;
    context.log_id = 20240101;
    Packet request = BuildRequest(method_info, Arguments{std::string("hello from the pbrpc example")},
                                  context, config);
    request.SetCorrelationId(1);

    // 4. Encode for transmission
    std::vector<Bytes> frames = EncodeForTransmission(request, config);
    std::cout << "Encoded " << frames.size() << " frames" << std::endl;

    // 5. Receive: find frame boundaries, decode and reassemble
    ChunkAssembler assembler(config);
    for (const auto& frame : frames) {
        try {
            auto frame_size = PeekFrameSize(frame.data(), frame.size(), config.max_body_size);
            if (!frame_size || *frame_size != frame.size()) {
                std::cerr << "Unexpected frame size" << std::endl;
                return 1;
            }

            auto packet = assembler.Feed(Packet::Decode(frame));
            if (!packet) {
                continue;
            }

            const Bytes& data = packet->GetData();
            std::cout << "Received " << packet->GetServiceName() << "." << packet->GetMethodName() << std::endl;
            std::cout << "  LogId: " << packet->GetLogId() << std::endl;
            std::cout << "  CorrelationId: " << packet->GetCorrelationId() << std::endl;
            std::cout << "  Data: " << std::string(data.begin(), data.end()) << std::endl;
            std::cout << "  Attachment size: " << packet->GetAttachment().size() << " bytes" << std::endl;
        } catch (const FormatError& e) {
            std::cerr << "Malformed frame: " << e.what() << std::endl;
            return 1;
        }
    }

    return 0;
}
