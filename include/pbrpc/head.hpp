#ifndef PBRPC_HEAD_HPP
#define PBRPC_HEAD_HPP

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pbrpc {

/// Fixed 12-byte packet head
/// Format: Magic(4) + TotalSize(4 BE) + MetaSize(4 BE)
/// TotalSize counts meta + data + attachment, not the head itself
class Head {
public:
    /// Construct a head carrying the default magic code
    Head();

    /// Construct a head with a custom magic code (must be 4 bytes)
    explicit Head(std::string magic_code);

    /// Get magic code
    const std::string& GetMagicCode() const;

    /// Set magic code
    /// @throws ArgumentError if magic_code is not exactly 4 bytes
    void SetMagicCode(std::string magic_code);

    /// True if the magic code equals protocol::MAGIC_CODE
    bool HasValidMagic() const;

    /// Get total size (meta + data + attachment)
    int32_t GetTotalSize() const;

    /// Get meta size
    int32_t GetMetaSize() const;

    void SetTotalSize(int32_t total_size);

    void SetMetaSize(int32_t meta_size);

    /// Encode to exactly protocol::HEAD_SIZE bytes
    Bytes Encode() const;

    /// Append the encoded head to buffer
    void EncodeTo(Bytes& buffer) const;

    /// Decode a head from the first 12 bytes of data
    /// An unexpected magic code is kept as-is; check HasValidMagic()
    /// @throws FormatError if fewer than 12 bytes are available
    static Head Decode(const uint8_t* data, size_t size);

private:
    std::string magic_code_;
    int32_t total_size_;
    int32_t meta_size_;
};

/// Size of the complete packet starting at data (head included)
/// @return std::nullopt while the head is still incomplete
/// @throws FormatError if the declared total size is negative or exceeds max_body_size
std::optional<size_t> PeekFrameSize(const uint8_t* data, size_t size,
                                    uint32_t max_body_size = protocol::MAX_BODY_SIZE);

} // namespace pbrpc

#endif // PBRPC_HEAD_HPP
