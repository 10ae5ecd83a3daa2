#pragma once

#include <caf/atom.hpp>
#include <caf/error.hpp>
#include <caf/make_message.hpp>
#include <cstdint>
#include <string>

namespace agentswarm {
namespace engine {

// Error category for every caf::error produced by the engine
constexpr caf::atom_value swarm_error_category = caf::atom("swarm");

// Synchronous failures returned to callers of actor/coordinator/driver operations.
// Task-level failures are not errors: they travel as Result values.
enum class swarm_errc : uint8_t {
    none = 0,
    // Lifecycle
    already_running = 1,
    stopped = 2,
    invalid_state = 3,
    // Capacity / registry
    mailbox_full = 10,
    duplicate_id = 11,
    not_found = 12,
    no_available_actor = 13,
    // Aggregates and arguments
    multiple_failures = 20,
    invalid_argument = 21,
    // Language completion backend
    completion_failed = 30,
    http_error = 31
};

inline caf::error make_error(swarm_errc code) {
    return caf::error{static_cast<uint8_t>(code), swarm_error_category};
}

inline caf::error make_error(swarm_errc code, std::string context) {
    return caf::error{static_cast<uint8_t>(code), swarm_error_category,
                      caf::make_message(std::move(context))};
}

std::string to_string(swarm_errc code);

// True if err belongs to the swarm category and carries the given code
bool is(const caf::error& err, swarm_errc code);

// Context string attached by make_error (empty if none)
std::string error_context(const caf::error& err);

// "<code>: <context>" for swarm errors, caf::to_string otherwise
std::string describe(const caf::error& err);

} // namespace engine
} // namespace agentswarm
