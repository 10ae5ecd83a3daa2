#pragma once

#include "agentswarm/engine/core.hpp"
#include <caf/expected.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace agentswarm {
namespace engine {

// Loads KEY=VALUE lines into the environment. '#' starts a comment line,
// surrounding quotes are stripped, variables already set are left alone.
// Returns the number of variables set; a missing file sets none.
size_t load_env_file(const std::string& path);

// OPENAI_API_KEY -> openai/gpt-4, else ANTHROPIC_API_KEY ->
// anthropic/claude-3-5-sonnet-20241022, else mock.
// AGENTSWARM_FORCE_MOCK_LLM forces mock.
LlmConfig llm_config_from_env();

// "host:port" -> (host, port). Fails with invalid_argument.
caf::expected<std::pair<std::string, uint16_t>> parse_endpoint(const std::string& endpoint);

} // namespace engine
} // namespace agentswarm
