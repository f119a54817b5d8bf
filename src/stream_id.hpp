#ifndef PBRPC_STREAM_ID_HPP
#define PBRPC_STREAM_ID_HPP

#include <cstdint>

namespace pbrpc {
namespace internal {

/// Next chunk stream id, non-negative and unique within the process
/// Thread-safe
int64_t NextStreamId();

} // namespace internal
} // namespace pbrpc

#endif // PBRPC_STREAM_ID_HPP
