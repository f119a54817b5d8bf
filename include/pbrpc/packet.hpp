#ifndef PBRPC_PACKET_HPP
#define PBRPC_PACKET_HPP

#include "config.hpp"
#include "head.hpp"
#include "meta.hpp"
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pbrpc {

/// Packet class representing one wire unit: Head | Meta | Data | Attachment
/// Uses Pimpl pattern to hide implementation details
/// An empty data or attachment buffer means the part is absent
class Packet {
public:
    /// Construct a packet without head or meta
    Packet();

    /// Construct a packet from its parts
    Packet(std::optional<Head> head, std::optional<RpcMeta> meta,
           Bytes data = {}, Bytes attachment = {});

    /// Move constructor
    Packet(Packet&& other) noexcept;

    /// Move assignment operator
    Packet& operator=(Packet&& other) noexcept;

    /// Destructor
    ~Packet();

    // Copies are explicit, see Clone()
    Packet(const Packet&) = delete;
    Packet& operator=(const Packet&) = delete;

    /// Deep copy of head, meta, data and attachment
    Packet Clone() const;

    const std::optional<Head>& GetHead() const;

    const std::optional<RpcMeta>& GetMeta() const;

    /// Get data (the serialized call argument or result)
    const Bytes& GetData() const;

    /// Get attachment
    const Bytes& GetAttachment() const;

    /// Local creation/receive time in milliseconds, never on the wire
    int64_t GetTimestamp() const;

    /// Service name of the request meta, empty if there is none
    std::string GetServiceName() const;

    /// Method name of the request meta, empty if there is none
    std::string GetMethodName() const;

    /// Log id of the request meta, 0 if there is none
    int64_t GetLogId() const;

    /// Correlation id, 0 if there is no meta
    int64_t GetCorrelationId() const;

    /// Set correlation id (transport use, creates the meta if missing)
    void SetCorrelationId(int64_t correlation_id);

    /// Set timestamp (transport use)
    void SetTimestamp(int64_t timestamp);

    /// Append bytes to data
    void MergeData(const Bytes& data);

    /// Replace the attachment
    void SetAttachment(Bytes attachment);

    /// Remove the chunk info once a stream has been reassembled
    void ClearChunkInfo();

    /// True if the meta carries chunk info
    bool IsChunkPackage() const;

    /// True if there is no chunk info or this is the terminal chunk
    bool IsFinalPackage() const;

    /// Stream id of the chunk info, if any
    std::optional<int64_t> GetChunkStreamId() const;

    /// Encode to wire bytes: Head(12) + Meta + Data + Attachment
    /// Updates the attachment size in the meta and both sizes in the head
    /// @throws StateError if head or meta is missing
    /// @throws FormatError if the meta cannot be serialized or the body exceeds int32
    Bytes Encode();

    /// Split data into chunks of chunk_size bytes sharing one stream id
    /// Returns a single clone when chunk_size < 1, data is empty or chunk_size >= data size
    /// Only the first chunk keeps the attachment; the last chunk gets FINAL_CHUNK_ID
    std::vector<Packet> Split(int64_t chunk_size) const;

    /// Derive an error response: same head and meta, request replaced by response
    Packet ErrorResponse(int32_t error_code, std::string error_text) const;

    /// Decode a packet from wire bytes
    /// @throws ArgumentError if data is null
    /// @throws FormatError on truncated or inconsistent input
    static Packet Decode(const uint8_t* data, size_t size);

    /// Decode a packet from wire bytes
    static Packet Decode(const Bytes& bytes);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Split a packet by config.chunk_size and encode every chunk, in transmission order
std::vector<Bytes> EncodeForTransmission(const Packet& packet, const ProtocolConfig& config);

} // namespace pbrpc

#endif // PBRPC_PACKET_HPP
