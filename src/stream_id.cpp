#include "stream_id.hpp"
#include <atomic>
#include <random>

namespace pbrpc {
namespace internal {

namespace {
    uint64_t RandomBase() {
        std::random_device device;
        return (static_cast<uint64_t>(device()) << 32) ^ static_cast<uint64_t>(device());
    }

    // splitmix64 finalizer, a bijection on 64-bit values
    uint64_t Mix(uint64_t value) {
        value += 0x9E3779B97F4A7C15ULL;
        value = (value ^ (value >> 30)) * 0xBF58476D1CE4E5B9ULL;
        value = (value ^ (value >> 27)) * 0x94D049BB133111EBULL;
        return value ^ (value >> 31);
    }

    std::atomic<uint64_t> stream_counter(RandomBase());
}

int64_t NextStreamId() {
    uint64_t sequence = stream_counter.fetch_add(1, std::memory_order_relaxed);
    // Non-negative so ids never look like the FINAL_CHUNK_ID sentinel
    return static_cast<int64_t>(Mix(sequence) & 0x7FFFFFFFFFFFFFFFULL);
}

} // namespace internal
} // namespace pbrpc
