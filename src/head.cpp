#include "pbrpc/head.hpp"
#include "pbrpc/errors.hpp"
#include "endian_utils.hpp"
#include <utility>

namespace pbrpc {

Head::Head()
    : magic_code_(protocol::MAGIC_CODE)
    , total_size_(0)
    , meta_size_(0)
{}

Head::Head(std::string magic_code)
    : Head()
{
    SetMagicCode(std::move(magic_code));
}

const std::string& Head::GetMagicCode() const {
    return magic_code_;
}

void Head::SetMagicCode(std::string magic_code) {
    if (magic_code.size() != protocol::MAGIC_SIZE) {
        throw ArgumentError("Magic code must be exactly 4 bytes");
    }
    magic_code_ = std::move(magic_code);
}

bool Head::HasValidMagic() const {
    return magic_code_ == protocol::MAGIC_CODE;
}

int32_t Head::GetTotalSize() const {
    return total_size_;
}

int32_t Head::GetMetaSize() const {
    return meta_size_;
}

void Head::SetTotalSize(int32_t total_size) {
    total_size_ = total_size;
}

void Head::SetMetaSize(int32_t meta_size) {
    meta_size_ = meta_size;
}

Bytes Head::Encode() const {
    Bytes buffer;
    buffer.reserve(protocol::HEAD_SIZE);
    EncodeTo(buffer);
    return buffer;
}

void Head::EncodeTo(Bytes& buffer) const {
    // Write Magic (4 bytes)
    buffer.insert(buffer.end(), magic_code_.begin(), magic_code_.end());

    // Write TotalSize (4 bytes, big-endian)
    internal::WriteInt32BE(buffer, total_size_);

    // Write MetaSize (4 bytes, big-endian)
    internal::WriteInt32BE(buffer, meta_size_);
}

Head Head::Decode(const uint8_t* data, size_t size) {
    if (data == nullptr) {
        throw ArgumentError("Head data is null");
    }
    if (size < protocol::HEAD_SIZE) {
        throw FormatError("Incomplete head");
    }

    Head head;
    // Kept even when it is not "PRPC", callers decide what to do with it
    head.magic_code_.assign(reinterpret_cast<const char*>(data), protocol::MAGIC_SIZE);
    head.total_size_ = internal::ReadInt32BE(data + 4);
    head.meta_size_ = internal::ReadInt32BE(data + 8);
    return head;
}

std::optional<size_t> PeekFrameSize(const uint8_t* data, size_t size, uint32_t max_body_size) {
    if (size < protocol::HEAD_SIZE) {
        return std::nullopt;
    }

    Head head = Head::Decode(data, size);
    int32_t total_size = head.GetTotalSize();
    if (total_size < 0) {
        throw FormatError("Negative total size");
    }
    if (static_cast<uint32_t>(total_size) > max_body_size) {
        throw FormatError("Total size exceeds maximum body size");
    }

    return protocol::HEAD_SIZE + static_cast<size_t>(total_size);
}

} // namespace pbrpc
