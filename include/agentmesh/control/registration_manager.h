#ifndef AGENTMESH_CONTROL_REGISTRATION_MANAGER_H
#define AGENTMESH_CONTROL_REGISTRATION_MANAGER_H

#include "agentmesh/base/clock.h"
#include "agentmesh/base/config.h"
#include "agentmesh/discovery/agent_record.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace agentmesh {

class RegistryLink;

using RecordProvider = std::function<AgentRecord()>;

// Registration and heartbeat state machine. tick() performs at most one
// directory call and returns how many seconds to wait before the next tick.
class RegistrationManager {
public:
    RegistrationManager(const RegistrationConfig& config,
                        std::shared_ptr<RegistryLink> registry,
                        RecordProvider record_provider,
                        ClockFn clock = system_clock_fn());
    ~RegistrationManager();

    uint32_t tick();

    bool is_registered() const;
    uint32_t failed_attempts() const;
    uint32_t heartbeat_failures() const;

    // Unregisters from the directory if currently registered
    bool unregister();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agentmesh

#endif // AGENTMESH_CONTROL_REGISTRATION_MANAGER_H
