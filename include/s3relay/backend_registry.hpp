#pragma once

#include "s3relay/relay_config.hpp"
#include "s3relay/storage/object_store.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>

namespace s3relay {

/// Immutable snapshot of the backend in use. A transfer holds one for its
/// whole lifetime, so a config update never changes a client under it.
struct ActiveClient {
    uint64_t generation = 0;
    BackendConfig config;
    std::shared_ptr<ObjectStore> store;
};

/// Builds a store for a config; throws ConfigurationError when it cannot.
using StoreFactory = std::function<std::shared_ptr<ObjectStore>(const BackendConfig&)>;

/// Holds the process-wide active object-store client and swaps it atomically
/// when the backend settings change.
class BackendRegistry {
public:
    /// Uses ObjectStoreFactory::create unless a factory is given.
    explicit BackendRegistry(StoreFactory factory = {});

    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /// Current snapshot, or null before the first successful update().
    std::shared_ptr<const ActiveClient> get() const;

    /// Validate `config`, build a client for it and make it active.
    /// Throws ConfigurationError and leaves the current client in place
    /// when the config is malformed or the client cannot be built.
    std::shared_ptr<const ActiveClient> update(const BackendConfig& config);

    /// Build a throwaway client for `config` and list buckets with it.
    /// The active client is not touched.
    StorageError test_connection(const BackendConfig& config) const;

    uint64_t generation() const;

private:
    StoreFactory factory_;

    mutable std::shared_mutex mutex_;
    std::shared_ptr<const ActiveClient> active_;
    uint64_t generation_ = 0;
};

}  // namespace s3relay
