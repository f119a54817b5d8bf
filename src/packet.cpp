#include "pbrpc/packet.hpp"
#include "pbrpc/errors.hpp"
#include "packet_codec.hpp"
#include "stream_id.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

namespace pbrpc {

namespace {
    int64_t NowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

// Pimpl implementation
class Packet::Impl {
public:
    std::optional<Head> head;
    std::optional<RpcMeta> meta;
    Bytes data;
    Bytes attachment;
    int64_t timestamp = 0;

    Impl() = default;

    Impl(std::optional<Head> h, std::optional<RpcMeta> m, Bytes d, Bytes a)
        : head(std::move(h))
        , meta(std::move(m))
        , data(std::move(d))
        , attachment(std::move(a))
    {}

    RpcMeta& MutableMeta() {
        if (!meta) {
            meta.emplace();
        }
        return *meta;
    }
};

Packet::Packet()
    : impl_(std::make_unique<Impl>())
{}

Packet::Packet(std::optional<Head> head, std::optional<RpcMeta> meta, Bytes data, Bytes attachment)
    : impl_(std::make_unique<Impl>(std::move(head), std::move(meta), std::move(data), std::move(attachment)))
{}

Packet::Packet(Packet&& other) noexcept = default;

Packet& Packet::operator=(Packet&& other) noexcept = default;

Packet::~Packet() = default;

Packet Packet::Clone() const {
    Packet copy(impl_->head, impl_->meta, impl_->data, impl_->attachment);
    copy.impl_->timestamp = impl_->timestamp;
    return copy;
}

const std::optional<Head>& Packet::GetHead() const {
    return impl_->head;
}

const std::optional<RpcMeta>& Packet::GetMeta() const {
    return impl_->meta;
}

const Bytes& Packet::GetData() const {
    return impl_->data;
}

const Bytes& Packet::GetAttachment() const {
    return impl_->attachment;
}

int64_t Packet::GetTimestamp() const {
    return impl_->timestamp;
}

std::string Packet::GetServiceName() const {
    if (!impl_->meta || !impl_->meta->request) {
        return {};
    }
    return impl_->meta->request->service_name;
}

std::string Packet::GetMethodName() const {
    if (!impl_->meta || !impl_->meta->request) {
        return {};
    }
    return impl_->meta->request->method_name;
}

int64_t Packet::GetLogId() const {
    if (!impl_->meta || !impl_->meta->request) {
        return 0;
    }
    return impl_->meta->request->log_id;
}

int64_t Packet::GetCorrelationId() const {
    return impl_->meta ? impl_->meta->correlation_id : 0;
}

void Packet::SetCorrelationId(int64_t correlation_id) {
    impl_->MutableMeta().correlation_id = correlation_id;
}

void Packet::SetTimestamp(int64_t timestamp) {
    impl_->timestamp = timestamp;
}

void Packet::MergeData(const Bytes& data) {
    impl_->data.insert(impl_->data.end(), data.begin(), data.end());
}

void Packet::SetAttachment(Bytes attachment) {
    impl_->attachment = std::move(attachment);
}

void Packet::ClearChunkInfo() {
    if (impl_->meta) {
        impl_->meta->chunk_info.reset();
    }
}

bool Packet::IsChunkPackage() const {
    return GetChunkStreamId().has_value();
}

bool Packet::IsFinalPackage() const {
    if (!impl_->meta || !impl_->meta->chunk_info) {
        return true;
    }
    return impl_->meta->chunk_info->IsFinal();
}

std::optional<int64_t> Packet::GetChunkStreamId() const {
    if (!impl_->meta || !impl_->meta->chunk_info) {
        return std::nullopt;
    }
    return impl_->meta->chunk_info->stream_id;
}

Bytes Packet::Encode() {
    if (!impl_->head) {
        throw StateError("Packet head is missing");
    }
    if (!impl_->meta) {
        throw StateError("Packet meta is missing");
    }

    return internal::PacketCodec::Encode(*impl_->head, *impl_->meta, impl_->data, impl_->attachment);
}

std::vector<Packet> Packet::Split(int64_t chunk_size) const {
    std::vector<Packet> chunks;

    const Bytes& data = impl_->data;
    if (chunk_size < 1 || data.empty() || static_cast<uint64_t>(chunk_size) >= data.size()) {
        chunks.push_back(Clone());
        return chunks;
    }

    const int64_t stream_id = internal::NextStreamId();
    const size_t step = static_cast<size_t>(chunk_size);
    chunks.reserve((data.size() + step - 1) / step);

    int64_t chunk_id = 0;
    for (size_t start = 0; start < data.size(); start += step) {
        size_t end = std::min(start + step, data.size());
        bool last = end == data.size();

        // Only the first chunk carries the attachment
        Packet chunk(impl_->head, impl_->meta,
                     Bytes(data.begin() + start, data.begin() + end),
                     start == 0 ? impl_->attachment : Bytes{});
        chunk.impl_->timestamp = impl_->timestamp;
        chunk.impl_->MutableMeta().chunk_info =
            ChunkInfo{stream_id, last ? protocol::FINAL_CHUNK_ID : chunk_id};

        chunks.push_back(std::move(chunk));
        ++chunk_id;
    }

    return chunks;
}

Packet Packet::ErrorResponse(int32_t error_code, std::string error_text) const {
    RpcMeta meta = impl_->meta ? *impl_->meta : RpcMeta{};
    meta.request.reset();
    meta.response = ResponseMeta{error_code, std::move(error_text)};

    Packet response(impl_->head, std::move(meta));
    response.impl_->timestamp = NowMillis();
    return response;
}

Packet Packet::Decode(const uint8_t* data, size_t size) {
    internal::Frame frame = internal::PacketCodec::Decode(data, size);

    Packet packet(std::move(frame.head), std::move(frame.meta),
                  std::move(frame.data), std::move(frame.attachment));
    packet.impl_->timestamp = NowMillis();
    return packet;
}

Packet Packet::Decode(const Bytes& bytes) {
    // An empty vector may hand out a null data(), which is not an argument error here
    if (bytes.empty()) {
        throw FormatError("Incomplete head");
    }
    return Decode(bytes.data(), bytes.size());
}

std::vector<Bytes> EncodeForTransmission(const Packet& packet, const ProtocolConfig& config) {
    std::vector<Bytes> frames;
    for (auto& chunk : packet.Split(config.chunk_size)) {
        frames.push_back(chunk.Encode());
    }
    return frames;
}

} // namespace pbrpc
