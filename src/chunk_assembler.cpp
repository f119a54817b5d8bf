#include "pbrpc/chunk_assembler.hpp"
#include "pbrpc/errors.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace pbrpc {

namespace {
    // Dropped stream ids remembered when max_pending_streams is unlimited
    constexpr size_t DEFAULT_DISCARDED_STREAMS = 1024;
}

ChunkAssembler::ChunkAssembler(const ProtocolConfig& config)
    : config_(config)
{}

std::optional<Packet> ChunkAssembler::Feed(Packet packet) {
    std::optional<int64_t> stream_id = packet.GetChunkStreamId();
    if (!stream_id) {
        return std::move(packet);
    }

    const int64_t chunk_id = packet.GetMeta()->chunk_info->chunk_id;

    // The rest of a dropped stream never reaches the caller
    if (discarded_.count(*stream_id) > 0) {
        if (packet.IsFinalPackage()) {
            ForgetDiscarded(*stream_id);
        }
        return std::nullopt;
    }

    auto it = pending_.find(*stream_id);
    if (it == pending_.end()) {
        if (chunk_id != 0) {
            std::cerr << "Dropping chunk " << chunk_id << " of chunk stream " << *stream_id
                      << ": stream start was not received" << std::endl;
            if (!packet.IsFinalPackage()) {
                Discard(*stream_id);
            }
            return std::nullopt;
        }

        if (packet.GetData().size() > config_.max_body_size) {
            Discard(*stream_id);
            throw FormatError("Chunk stream exceeds maximum body size");
        }
        if (config_.max_pending_streams > 0 && pending_.size() >= config_.max_pending_streams) {
            EvictOldest();
        }
        pending_.emplace(*stream_id, std::move(packet));
        order_.push_back(*stream_id);
        return std::nullopt;
    }

    Packet& assembled = it->second;
    if (assembled.GetData().size() + packet.GetData().size() > config_.max_body_size) {
        pending_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), *stream_id), order_.end());
        if (!packet.IsFinalPackage()) {
            Discard(*stream_id);
        }
        throw FormatError("Chunk stream exceeds maximum body size");
    }
    assembled.MergeData(packet.GetData());
    if (assembled.GetAttachment().empty() && !packet.GetAttachment().empty()) {
        assembled.SetAttachment(packet.GetAttachment());
    }

    if (!packet.IsFinalPackage()) {
        return std::nullopt;
    }

    Packet result = std::move(assembled);
    pending_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), *stream_id), order_.end());

    result.ClearChunkInfo();
    return std::move(result);
}

size_t ChunkAssembler::PendingCount() const {
    return pending_.size();
}

void ChunkAssembler::Clear() {
    pending_.clear();
    order_.clear();
    discarded_.clear();
    discarded_order_.clear();
}

void ChunkAssembler::EvictOldest() {
    if (order_.empty()) {
        return;
    }

    int64_t stream_id = order_.front();
    order_.pop_front();
    pending_.erase(stream_id);
    Discard(stream_id);
    std::cerr << "Dropping incomplete chunk stream " << stream_id
              << ": too many pending streams" << std::endl;
}

void ChunkAssembler::Discard(int64_t stream_id) {
    if (!discarded_.insert(stream_id).second) {
        return;
    }
    discarded_order_.push_back(stream_id);

    size_t limit = config_.max_pending_streams > 0 ? config_.max_pending_streams : DEFAULT_DISCARDED_STREAMS;
    while (discarded_order_.size() > limit) {
        discarded_.erase(discarded_order_.front());
        discarded_order_.pop_front();
    }
}

void ChunkAssembler::ForgetDiscarded(int64_t stream_id) {
    discarded_.erase(stream_id);
    discarded_order_.erase(std::remove(discarded_order_.begin(), discarded_order_.end(), stream_id),
                           discarded_order_.end());
}

} // namespace pbrpc
