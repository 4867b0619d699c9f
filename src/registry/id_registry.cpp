#include "id_registry.hpp"
#include "errors.hpp"
#include "../common/metrics.hpp"
#include "../common/names.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace idreg {

IdRegistry::IdRegistry(RegistryOptions options)
    : max_ids_(options.max_ids),
      owner_resolver_(std::move(options.owner_resolver)),
      store_(std::move(options.store_path)),
      live_(std::make_unique<std::atomic<IndexIdPtr>[]>(MAX_IDS + 1)) {

    if (max_ids_ == 0 || max_ids_ > MAX_IDS) {
        throw std::invalid_argument("max_ids must be in [1, " + std::to_string(MAX_IDS) + "]");
    }
    if (store_.path().empty()) {
        throw std::invalid_argument("IdRegistry requires a store path");
    }

    std::lock_guard<std::mutex> lock(names_mutex_);
    names_ = store_.load();
    name_to_id_.reserve(names_.size());
    for (size_t i = 0; i < names_.size(); ++i) {
        // Empty entries are reserved ids with no name
        if (!names_[i].empty()) {
            name_to_id_.emplace(names_[i], static_cast<uint16_t>(i + 1));
        }
    }
    publish_gauges(names_.size());
}

IndexIdPtr IdRegistry::register_name(std::string_view name, std::optional<Owner> owner) {
    check_name(name);
    std::lock_guard<std::mutex> lock(create_mutex_);

    if (auto found = find_by_name(name, owner)) {
        return found;
    }

    uint16_t id = string_to_id(name);
    return adopt(name, id, std::move(owner));
}

IndexIdPtr IdRegistry::register_name(std::string_view name) {
    std::optional<Owner> owner = owner_resolver_ ? owner_resolver_(CALLER_DEPTH) : std::nullopt;
    return register_name(name, std::move(owner));
}

IndexIdPtr IdRegistry::register_unique(std::string_view name, std::optional<Owner> owner) {
    check_name(name);
    std::lock_guard<std::mutex> lock(create_mutex_);

    if (auto existing = find_by_name(name)) {
        auto context = registration_context(existing);
        std::optional<Owner> existing_owner = context ? context->owner : std::nullopt;
        spdlog::error("Duplicate registration of id '{}' (id {})", existing->name(), existing->unique_id());
        throw DuplicateRegistration(existing->name(), existing_owner, owner);
    }

    uint16_t id = string_to_id(name);
    return adopt(name, id, std::move(owner));
}

IndexIdPtr IdRegistry::find_by_name(std::string_view name) const {
    auto id = lookup_id(name);
    return id ? find_by_id(*id) : nullptr;
}

IndexIdPtr IdRegistry::find_by_name(std::string_view name,
                                    const std::optional<Owner>& required_owner) const {
    auto id = lookup_id(name);
    if (!id) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(registrations_mutex_);
    IndexIdPtr handle = live_[*id].load();
    if (!handle) {
        return nullptr;
    }

    auto it = registrations_.find(*id);
    if (it != registrations_.end() && it->second.owner != required_owner) {
        MetricsCollector::instance().increment_counter("registry_ownership_conflicts_total");
        spdlog::error("Id '{}' requested for owner {} but registered for {}; registration stack:\n{}",
                      handle->name(), owner_to_string(required_owner),
                      owner_to_string(it->second.owner), it->second.stacktrace);
        throw OwnershipConflict(handle->name(), required_owner, it->second);
    }
    return handle;
}

IndexIdPtr IdRegistry::find_by_id(int id) const {
    if (id < 1 || id > MAX_IDS) {
        return nullptr;
    }
    return live_[id].load();
}

void IdRegistry::unregister(const IndexIdPtr& handle) {
    if (!handle) {
        throw std::invalid_argument("Cannot unregister a null id");
    }

    std::lock_guard<std::mutex> create_lock(create_mutex_);
    std::lock_guard<std::mutex> lock(registrations_mutex_);

    uint16_t id = handle->unique_id();
    IndexIdPtr current = id <= MAX_IDS ? live_[id].load() : nullptr;
    if (current != handle) {
        spdlog::error("Unregistering id '{}' ({}) that is not the live registration", handle->name(), id);
        throw InvariantViolation("ID with name '" + handle->name() + "' and id " + std::to_string(id) +
                                 " is not the registered instance");
    }

    live_[id].store(nullptr);
    registrations_.erase(id);
    live_count_.fetch_sub(1);

    MetricsCollector::instance().increment_counter("registry_unregistrations_total");
    MetricsCollector::instance().set_gauge("registry_live_ids", static_cast<double>(live_count_.load()));
    spdlog::debug("Unregistered id {} '{}'", id, handle->name());
}

std::optional<RegistrationContext> IdRegistry::registration_context(const IndexIdPtr& handle) const {
    if (!handle) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(registrations_mutex_);
    if (find_by_id(handle->unique_id()) != handle) {
        return std::nullopt;
    }
    auto it = registrations_.find(handle->unique_id());
    if (it == registrations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string IdRegistry::dump() const {
    std::ostringstream out;
    out << "ID registry: {";

    bool first = true;
    for (const auto& entry : snapshot()) {
        if (!first) {
            out << ", ";
        }
        out << entry.id << "=" << entry.name;
        first = false;
    }

    out << "}";
    return out.str();
}

std::vector<RegistryEntry> IdRegistry::snapshot() const {
    size_t persisted = persisted_count();

    std::lock_guard<std::mutex> lock(registrations_mutex_);
    std::vector<RegistryEntry> entries;
    entries.reserve(live_count_.load());

    for (size_t i = 1; i <= persisted; ++i) {
        IndexIdPtr handle = live_[i].load();
        if (!handle) {
            continue;
        }

        RegistryEntry entry{handle->unique_id(), handle->name(), std::nullopt, {}};
        auto it = registrations_.find(handle->unique_id());
        if (it != registrations_.end()) {
            entry.owner = it->second.owner;
            entry.registered_at = it->second.registered_at;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

void IdRegistry::reinitialize_disk_storage() {
    std::lock_guard<std::mutex> lock(names_mutex_);
    store_.rewrite(names_);
    spdlog::info("Reinitialized id store {} with {} names", store_.path().string(), names_.size());
}

size_t IdRegistry::persisted_count() const {
    std::lock_guard<std::mutex> lock(names_mutex_);
    return names_.size();
}

std::optional<uint16_t> IdRegistry::lookup_id(std::string_view name) const {
    std::lock_guard<std::mutex> lock(names_mutex_);
    auto it = name_to_id_.find(std::string(name));
    if (it == name_to_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint16_t IdRegistry::string_to_id(std::string_view name) {
    std::lock_guard<std::mutex> lock(names_mutex_);

    auto it = name_to_id_.find(std::string(name));
    if (it != name_to_id_.end()) {
        return it->second;
    }

    uint32_t next = static_cast<uint32_t>(names_.size()) + 1;
    if (next > max_ids_) {
        spdlog::error("Cannot allocate id for '{}': {} ids in use", name, names_.size());
        throw CapacityExceeded(std::string(name), next, max_ids_);
    }

    // Persist before publishing so a failed write leaves no trace
    names_.emplace_back(name);
    try {
        store_.rewrite(names_);
    } catch (const PersistenceFailure& e) {
        names_.pop_back();
        spdlog::error("Failed to persist id for '{}': {}", name, e.what());
        throw;
    }

    uint16_t id = static_cast<uint16_t>(next);
    name_to_id_.emplace(names_.back(), id);

    MetricsCollector::instance().increment_counter("registry_ids_allocated_total");
    publish_gauges(names_.size());
    spdlog::info("Allocated id {} for '{}'", id, name);
    return id;
}

IndexIdPtr IdRegistry::adopt(std::string_view name, uint16_t id, std::optional<Owner> owner) {
    auto handle = std::make_shared<const IndexId>(id, std::string(name));
    RegistrationContext context = RegistrationContext::capture(std::move(owner));

    {
        std::lock_guard<std::mutex> lock(registrations_mutex_);
        if (IndexIdPtr existing = live_[id].load()) {
            auto it = registrations_.find(id);
            std::optional<Owner> existing_owner =
                it != registrations_.end() ? it->second.owner : std::nullopt;
            throw DuplicateRegistration(existing->name(), existing_owner, context.owner);
        }

        registrations_.emplace(id, std::move(context));
        live_[id].store(handle);
        live_count_.fetch_add(1);
    }

    MetricsCollector::instance().increment_counter("registry_registrations_total");
    MetricsCollector::instance().set_gauge("registry_live_ids", static_cast<double>(live_count_.load()));
    spdlog::debug("Registered id {} '{}'", id, handle->name());
    return handle;
}

void IdRegistry::check_name(std::string_view name) const {
    if (!is_valid_name(name)) {
        throw InvalidName("Invalid id name '" + std::string(name) +
                          "': must be non-empty single-line UTF-8");
    }
}

void IdRegistry::publish_gauges(size_t persisted) const {
    MetricsCollector::instance().set_gauge("registry_persisted_ids", static_cast<double>(persisted));
    MetricsCollector::instance().set_gauge("registry_live_ids", static_cast<double>(live_count_.load()));
}

} // namespace idreg
