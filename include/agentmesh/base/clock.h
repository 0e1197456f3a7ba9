#ifndef AGENTMESH_BASE_CLOCK_H
#define AGENTMESH_BASE_CLOCK_H

#include <chrono>
#include <cstdint>
#include <functional>

namespace agentmesh {

// Milliseconds since epoch; injectable so TTL logic can be driven from tests
using ClockFn = std::function<uint64_t()>;

inline uint64_t system_now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

inline ClockFn system_clock_fn() {
    return &system_now_ms;
}

} // namespace agentmesh

#endif // AGENTMESH_BASE_CLOCK_H
