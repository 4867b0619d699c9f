#pragma once

#include "index_id.hpp"
#include "../store/enum_store.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace idreg {

struct RegistryOptions {
    std::filesystem::path store_path;
    uint16_t max_ids = MAX_IDS;
    OwnerResolver owner_resolver;  // consulted by register_name(name) only
};

struct RegistryEntry {
    uint16_t id;
    std::string name;
    std::optional<Owner> owner;
    std::chrono::system_clock::time_point registered_at;
};

/**
 * Process-wide name to dense id registry backed by an EnumStore.
 *
 * Ids are handed out sequentially starting at 1 and are persisted before the
 * handle is returned, so a name keeps its id across restarts. Handles are
 * unique per name while live: repeated registrations return the same object.
 */
class IdRegistry {
public:
    // Loads the store; a missing or corrupt store yields an empty registry.
    explicit IdRegistry(RegistryOptions options);

    IdRegistry(const IdRegistry&) = delete;
    IdRegistry& operator=(const IdRegistry&) = delete;

    // Idempotent. Throws OwnershipConflict if the name is live under another
    // owner, CapacityExceeded or PersistenceFailure when a new id cannot be
    // allocated.
    IndexIdPtr register_name(std::string_view name, std::optional<Owner> owner);
    IndexIdPtr register_name(std::string_view name);

    // Throws DuplicateRegistration if the name already has a live handle.
    IndexIdPtr register_unique(std::string_view name, std::optional<Owner> owner);

    IndexIdPtr find_by_name(std::string_view name) const;
    // Throws OwnershipConflict if a live handle exists under a different owner.
    IndexIdPtr find_by_name(std::string_view name, const std::optional<Owner>& required_owner) const;
    IndexIdPtr find_by_id(int id) const;

    // The persisted id stays reserved for this name.
    void unregister(const IndexIdPtr& handle);

    std::optional<RegistrationContext> registration_context(const IndexIdPtr& handle) const;

    std::string dump() const;
    std::vector<RegistryEntry> snapshot() const;

    // Rewrites the store from the in-memory name list.
    void reinitialize_disk_storage();

    size_t persisted_count() const;
    size_t live_count() const { return live_count_.load(); }
    uint16_t max_ids() const { return max_ids_; }
    const EnumStore& store() const { return store_; }

private:
    std::optional<uint16_t> lookup_id(std::string_view name) const;
    uint16_t string_to_id(std::string_view name);
    IndexIdPtr adopt(std::string_view name, uint16_t id, std::optional<Owner> owner);
    void check_name(std::string_view name) const;
    void publish_gauges(size_t persisted) const;

    static constexpr int CALLER_DEPTH = 4;

    uint16_t max_ids_;
    OwnerResolver owner_resolver_;

    // Guards store_, names_ and name_to_id_ together
    mutable std::mutex names_mutex_;
    EnumStore store_;
    std::vector<std::string> names_;  // id - 1
    std::unordered_map<std::string, uint16_t> name_to_id_;

    // Serializes register/unregister as a whole
    std::mutex create_mutex_;

    // Indexed by id, slot 0 unused. Reads do not lock.
    std::unique_ptr<std::atomic<IndexIdPtr>[]> live_;
    std::atomic<size_t> live_count_{0};

    // Owner and creation context of every live handle, by id
    mutable std::mutex registrations_mutex_;
    std::unordered_map<uint16_t, RegistrationContext> registrations_;
};

} // namespace idreg
