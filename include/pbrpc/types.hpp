#ifndef PBRPC_TYPES_HPP
#define PBRPC_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pbrpc {

// Type aliases
using Bytes = std::vector<uint8_t>;

/// Compression tag carried in the meta; the payload is never (de)compressed here
enum class CompressType : int32_t {
    NONE = 0,
    SNAPPY = 1,
    GZIP = 2,
};

// Protocol constants
namespace protocol {
    constexpr const char* MAGIC_CODE = "PRPC";
    constexpr size_t MAGIC_SIZE = 4;
    constexpr size_t HEAD_SIZE = 12;  // Magic(4) + TotalSize(4) + MetaSize(4)
    constexpr int64_t FINAL_CHUNK_ID = -1;
    constexpr uint32_t MAX_BODY_SIZE = 512u * 1024 * 1024;  // 512MB
}

} // namespace pbrpc

#endif // PBRPC_TYPES_HPP
