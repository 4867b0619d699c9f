#pragma once

#include "index_id.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace idreg {

class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidName : public RegistryError {
public:
    using RegistryError::RegistryError;
};

class CapacityExceeded : public RegistryError {
public:
    CapacityExceeded(const std::string& name, uint32_t requested_id, uint16_t max_ids)
        : RegistryError("Number of indices exceeded: " + std::to_string(requested_id) +
                        " > " + std::to_string(max_ids) + " while registering '" + name + "'") {}
};

class DuplicateRegistration : public RegistryError {
public:
    DuplicateRegistration(const std::string& name,
                          const std::optional<Owner>& existing,
                          const std::optional<Owner>& caller)
        : RegistryError("ID with name '" + name + "' is already registered in " +
                        owner_to_string(existing) + " but current caller is " +
                        owner_to_string(caller)) {}
};

// Carries the context of the original registration for debugging.
class OwnershipConflict : public RegistryError {
public:
    OwnershipConflict(const std::string& name,
                      const std::optional<Owner>& requested,
                      RegistrationContext original)
        : RegistryError("ID with name '" + name + "' requested for owner " +
                        owner_to_string(requested) + " but registered for " +
                        owner_to_string(original.owner)),
          name_(name), requested_(requested), original_(std::move(original)) {}

    const std::string& name() const { return name_; }
    const std::optional<Owner>& requested_owner() const { return requested_; }
    const std::optional<Owner>& actual_owner() const { return original_.owner; }
    const RegistrationContext& original_context() const { return original_; }

private:
    std::string name_;
    std::optional<Owner> requested_;
    RegistrationContext original_;
};

class PersistenceFailure : public RegistryError {
public:
    using RegistryError::RegistryError;
};

class InvariantViolation : public RegistryError {
public:
    using RegistryError::RegistryError;
};

} // namespace idreg
