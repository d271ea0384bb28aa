#include "s3relay/backend_registry.hpp"
#include "s3relay/log.hpp"

#include <mutex>

namespace s3relay {

BackendRegistry::BackendRegistry(StoreFactory factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const BackendConfig& config) { return ObjectStoreFactory::create(config); };
    }
}

std::shared_ptr<const ActiveClient> BackendRegistry::get() const {
    std::shared_lock lock(mutex_);
    return active_;
}

std::shared_ptr<const ActiveClient> BackendRegistry::update(const BackendConfig& config) {
    auto err = config.validate();
    if (!err.empty()) {
        log_error("Rejected backend config: %s", err.c_str());
        throw ConfigurationError(err);
    }

    // Client construction may touch the network stack or filesystem; keep it
    // outside the lock so readers are never blocked on it.
    std::shared_ptr<ObjectStore> store;
    try {
        store = factory_(config);
    } catch (const ConfigurationError& e) {
        log_error("Cannot build %s client: %s", config.type.c_str(), e.what());
        throw;
    } catch (const std::exception& e) {
        log_error("Cannot build %s client: %s", config.type.c_str(), e.what());
        throw ConfigurationError(e.what());
    }
    if (!store) {
        throw ConfigurationError("no client for backend type: " + config.type);
    }

    auto next = std::make_shared<ActiveClient>();
    next->config = config;
    next->store = std::move(store);

    {
        std::unique_lock lock(mutex_);
        next->generation = ++generation_;
        active_ = next;
    }

    log_info("Backend client swapped: generation=%llu %s",
             static_cast<unsigned long long>(next->generation), config.summary().c_str());
    return next;
}

StorageError BackendRegistry::test_connection(const BackendConfig& config) const {
    auto err = config.validate();
    if (!err.empty()) {
        return StorageError::configuration(err);
    }
    std::shared_ptr<ObjectStore> store;
    try {
        store = factory_(config);
    } catch (const std::exception& e) {
        return StorageError::configuration(e.what());
    }
    if (!store) {
        return StorageError::configuration("no client for backend type: " + config.type);
    }

    auto result = store->list_buckets();
    if (!result.error.ok()) {
        log_warn("Connection test failed for %s: %s", config.summary().c_str(),
                 result.error.describe().c_str());
    }
    return result.error;
}

uint64_t BackendRegistry::generation() const {
    std::shared_lock lock(mutex_);
    return generation_;
}

}  // namespace s3relay
