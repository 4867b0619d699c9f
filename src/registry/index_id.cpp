#include "index_id.hpp"
#include <boost/stacktrace.hpp>
#include <sstream>
#include <thread>

namespace idreg {

std::string owner_to_string(const std::optional<Owner>& owner) {
    return owner ? owner->id : std::string("<none>");
}

RegistrationContext RegistrationContext::capture(std::optional<Owner> owner) {
    RegistrationContext context;
    context.owner = std::move(owner);
    context.registered_at = std::chrono::system_clock::now();

    std::ostringstream thread;
    thread << std::this_thread::get_id();
    context.thread = thread.str();

    // Skip capture() itself
    context.stacktrace = boost::stacktrace::to_string(boost::stacktrace::stacktrace(1, 64));
    return context;
}

} // namespace idreg
