#include "agentmesh/control/registration_manager.h"
#include "agentmesh/discovery/registry_client.h"
#include "agentmesh/base/logger.h"
#include <mutex>
#include <optional>
#include <string>

namespace agentmesh {

struct RegistrationManager::Impl {
    RegistrationConfig config;
    std::shared_ptr<RegistryLink> registry;
    RecordProvider record_provider;
    ClockFn clock;

    mutable std::mutex mutex;
    bool registered = false;
    uint32_t failed_attempts = 0;
    uint32_t heartbeat_failures = 0;
    std::optional<uint64_t> last_attempt_ms;
    std::string registered_id;

    Impl(const RegistrationConfig& cfg, std::shared_ptr<RegistryLink> reg,
         RecordProvider provider, ClockFn clk)
        : config(cfg), registry(std::move(reg)),
          record_provider(std::move(provider)), clock(std::move(clk)) {}

    uint64_t cooldown_ms() const {
        return static_cast<uint64_t>(config.cooldown_sec) * 1000;
    }

    void drop_registration(uint64_t now) {
        registered = false;
        heartbeat_failures = 0;
        failed_attempts = 0;
        last_attempt_ms = now;
    }

    uint32_t try_register(uint64_t now) {
        if (last_attempt_ms && now >= *last_attempt_ms && now - *last_attempt_ms < cooldown_ms()) {
            uint64_t remaining_ms = cooldown_ms() - (now - *last_attempt_ms);
            return static_cast<uint32_t>((remaining_ms + 999) / 1000);
        }

        last_attempt_ms = now;
        AgentRecord record = record_provider();
        bool ok = false;
        try {
            ok = registry->register_agent(record);
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("Registration raised: ") + e.what());
        }

        if (ok) {
            registered = true;
            registered_id = record.id;
            failed_attempts = 0;
            heartbeat_failures = 0;
            Logger::instance().info("Registered " + record.id + " with directory");
            return config.settle_sec;
        }

        ++failed_attempts;
        Logger::instance().warning("Registration attempt {}/{} failed",
                                   failed_attempts, config.max_attempts);
        if (failed_attempts >= config.max_attempts) {
            Logger::instance().warning("Max registration attempts reached, backing off for {}s",
                                       config.backoff_sec);
            failed_attempts = 0;
            return config.backoff_sec;
        }
        return config.cooldown_sec;
    }

    uint32_t send_heartbeat(uint64_t now) {
        HeartbeatStatus status = HeartbeatStatus::Error;
        try {
            status = registry->heartbeat(registered_id);
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("Heartbeat raised: ") + e.what());
        }

        switch (status) {
            case HeartbeatStatus::Ok:
                heartbeat_failures = 0;
                return config.heartbeat_interval_sec;

            case HeartbeatStatus::NotFound:
                Logger::instance().warning("Directory lost our registration, will re-register");
                drop_registration(now);
                return config.cooldown_sec;

            case HeartbeatStatus::Error:
            default:
                ++heartbeat_failures;
                if (heartbeat_failures >= config.max_attempts) {
                    Logger::instance().error("Heartbeat failed {} times, marking unregistered",
                                             heartbeat_failures);
                    drop_registration(now);
                    return config.cooldown_sec;
                }
                return config.heartbeat_interval_sec;
        }
    }
};

RegistrationManager::RegistrationManager(const RegistrationConfig& config,
                                         std::shared_ptr<RegistryLink> registry,
                                         RecordProvider record_provider,
                                         ClockFn clock)
    : impl_(std::make_unique<Impl>(config, std::move(registry),
                                   std::move(record_provider), std::move(clock))) {}

RegistrationManager::~RegistrationManager() = default;

uint32_t RegistrationManager::tick() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->registry) {
        return impl_->config.heartbeat_interval_sec;
    }

    uint64_t now = impl_->clock();
    if (!impl_->registered) {
        return impl_->try_register(now);
    }
    return impl_->send_heartbeat(now);
}

bool RegistrationManager::is_registered() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->registered;
}

uint32_t RegistrationManager::failed_attempts() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->failed_attempts;
}

uint32_t RegistrationManager::heartbeat_failures() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->heartbeat_failures;
}

bool RegistrationManager::unregister() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->registered || !impl_->registry) {
        return false;
    }

    bool ok = false;
    try {
        ok = impl_->registry->unregister_agent(impl_->registered_id);
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Unregister raised: ") + e.what());
    }
    impl_->registered = false;
    return ok;
}

} // namespace agentmesh
