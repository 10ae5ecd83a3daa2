#include "agentswarm/engine/errors.hpp"
#include <caf/message.hpp>

namespace agentswarm {
namespace engine {

std::string to_string(swarm_errc code) {
    switch (code) {
        case swarm_errc::none:
            return "none";
        case swarm_errc::already_running:
            return "already_running";
        case swarm_errc::stopped:
            return "stopped";
        case swarm_errc::invalid_state:
            return "invalid_state";
        case swarm_errc::mailbox_full:
            return "mailbox_full";
        case swarm_errc::duplicate_id:
            return "duplicate_id";
        case swarm_errc::not_found:
            return "not_found";
        case swarm_errc::no_available_actor:
            return "no_available_actor";
        case swarm_errc::multiple_failures:
            return "multiple_failures";
        case swarm_errc::invalid_argument:
            return "invalid_argument";
        case swarm_errc::completion_failed:
            return "completion_failed";
        case swarm_errc::http_error:
            return "http_error";
        default:
            return "unknown";
    }
}

bool is(const caf::error& err, swarm_errc code) {
    return err && err.category() == swarm_error_category
           && err.code() == static_cast<uint8_t>(code);
}

std::string error_context(const caf::error& err) {
    if (!err) {
        return "";
    }
    const auto& ctx = err.context();
    if (ctx.size() == 1 && ctx.match_element<std::string>(0)) {
        return ctx.get_as<std::string>(0);
    }
    return "";
}

std::string describe(const caf::error& err) {
    if (!err) {
        return "none";
    }
    if (err.category() != swarm_error_category) {
        return caf::to_string(err);
    }
    auto result = to_string(static_cast<swarm_errc>(err.code()));
    auto ctx = error_context(err);
    if (!ctx.empty()) {
        result += ": " + ctx;
    }
    return result;
}

} // namespace engine
} // namespace agentswarm
