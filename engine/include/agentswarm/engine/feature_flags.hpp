#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace agentswarm {
namespace engine {

/**
 * Feature flags
 *
 * Flags default to `false` and are read from environment variables:
 * - AGENTSWARM_OBSERVABILITY_METRICS_ENABLED
 * - AGENTSWARM_FORCE_MOCK_LLM
 */
class FeatureFlags {
public:
    /**
     * Check if Prometheus metrics collection and the `/metrics` route are enabled
     */
    static bool is_observability_metrics_enabled() {
        return get_env_bool("AGENTSWARM_OBSERVABILITY_METRICS_ENABLED", false);
    }

    /**
     * Check if the offline completion stub must be used even when API keys are present
     */
    static bool is_mock_llm_forced() {
        return get_env_bool("AGENTSWARM_FORCE_MOCK_LLM", false);
    }

    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     *
     * Returns `default_value` if environment variable is not set or has other value.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }

    static std::string get_env_string(const char* env_var, const std::string& default_value = "") {
        const char* value = std::getenv(env_var);
        return value == nullptr ? default_value : std::string(value);
    }
};

} // namespace engine
} // namespace agentswarm
