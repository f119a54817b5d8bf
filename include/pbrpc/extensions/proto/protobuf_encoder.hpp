#ifndef PBRPC_EXTENSIONS_PROTO_PROTOBUF_ENCODER_HPP
#define PBRPC_EXTENSIONS_PROTO_PROTOBUF_ENCODER_HPP

#include <pbrpc/packet.hpp>
#include <pbrpc/request_builder.hpp>
#include <google/protobuf/message_lite.h>
#include <any>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace pbrpc::extensions::proto {

/// Serialize a Protobuf message into bytes
/// @tparam T Protobuf message type (must inherit from google::protobuf::MessageLite)
/// @throws std::runtime_error if serialization fails
template<typename T>
Bytes Serialize(const T& message) {
    static_assert(std::is_base_of<google::protobuf::MessageLite, T>::value,
                  "T must be a Protobuf message type");

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        throw std::runtime_error("Failed to serialize Protobuf message");
    }

    return Bytes(serialized.begin(), serialized.end());
}

/// Create an ArgumentEncoder for methods taking a Protobuf message
/// The argument may hold either T or std::shared_ptr<T>
/// @throws std::bad_any_cast (from the encoder) if the argument holds another type
template<typename T>
ArgumentEncoder MakeProtobufEncoder() {
    static_assert(std::is_base_of<google::protobuf::MessageLite, T>::value,
                  "T must be a Protobuf message type");

    return [](const std::any& argument) -> Bytes {
        if (const auto* shared = std::any_cast<std::shared_ptr<T>>(&argument)) {
            if (!*shared) {
                throw std::invalid_argument("Message pointer is null");
            }
            return Serialize(**shared);
        }
        return Serialize(std::any_cast<const T&>(argument));
    };
}

/// Parse a Packet's data as a Protobuf message
/// @tparam T Protobuf message type
/// @return Deserialized Protobuf message
/// @throws std::runtime_error if parsing fails
template<typename T>
T ParseData(const Packet& packet) {
    static_assert(std::is_base_of<google::protobuf::MessageLite, T>::value,
                  "T must be a Protobuf message type");

    T message;
    const auto& data = packet.GetData();

    if (!message.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        throw std::runtime_error("Failed to parse Protobuf message");
    }

    return message;
}

/// Non-throwing version of ParseData
template<typename T>
std::optional<T> TryParseData(const Packet& packet) {
    static_assert(std::is_base_of<google::protobuf::MessageLite, T>::value,
                  "T must be a Protobuf message type");

    T message;
    const auto& data = packet.GetData();
    if (!message.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        return std::nullopt;
    }
    return message;
}

} // namespace pbrpc::extensions::proto

#endif // PBRPC_EXTENSIONS_PROTO_PROTOBUF_ENCODER_HPP
