#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace idreg {

// Ids are persisted as 1-based line numbers and must fit a signed 16-bit slot.
constexpr std::uint16_t MAX_IDS = 32767;

struct Owner {
    std::string id;

    bool operator==(const Owner& other) const = default;
};

// Renders an optional owner, "<none>" for the no-owner sentinel.
std::string owner_to_string(const std::optional<Owner>& owner);

// Answers "who is registering" for a given call-stack depth.
using OwnerResolver = std::function<std::optional<Owner>(int call_depth)>;

struct RegistrationContext {
    std::optional<Owner> owner;
    std::chrono::system_clock::time_point registered_at;
    std::string thread;
    std::string stacktrace;

    static RegistrationContext capture(std::optional<Owner> owner);
};

class IndexId {
public:
    IndexId(std::uint16_t unique_id, std::string name)
        : unique_id_(unique_id), name_(std::move(name)) {}

    IndexId(const IndexId&) = delete;
    IndexId& operator=(const IndexId&) = delete;

    std::uint16_t unique_id() const { return unique_id_; }
    const std::string& name() const { return name_; }

    bool operator==(const IndexId& other) const { return unique_id_ == other.unique_id_; }

private:
    std::uint16_t unique_id_;
    std::string name_;
};

using IndexIdPtr = std::shared_ptr<const IndexId>;

} // namespace idreg

template<>
struct std::hash<idreg::IndexId> {
    size_t operator()(const idreg::IndexId& id) const noexcept {
        return id.unique_id();
    }
};
