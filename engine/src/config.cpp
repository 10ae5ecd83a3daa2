#include "agentswarm/engine/config.hpp"
#include "agentswarm/engine/errors.hpp"
#include "agentswarm/engine/feature_flags.hpp"
#include <cstdlib>
#include <fstream>

namespace agentswarm {
namespace engine {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

size_t load_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return 0;
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        auto key = trim(line.substr(0, eq));
        auto value = unquote(trim(line.substr(eq + 1)));
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            loaded++;
        }
    }
    return loaded;
}

LlmConfig llm_config_from_env() {
    LlmConfig config;
    if (FeatureFlags::is_mock_llm_forced()) {
        config.provider = "mock";
        return config;
    }

    auto openai_key = FeatureFlags::get_env_string("OPENAI_API_KEY");
    if (!openai_key.empty()) {
        config.provider = "openai";
        config.api_key = openai_key;
        config.model = "gpt-4";
        return config;
    }

    auto anthropic_key = FeatureFlags::get_env_string("ANTHROPIC_API_KEY");
    if (!anthropic_key.empty()) {
        config.provider = "anthropic";
        config.api_key = anthropic_key;
        config.model = "claude-3-5-sonnet-20241022";
        return config;
    }

    config.provider = "mock";
    return config;
}

caf::expected<std::pair<std::string, uint16_t>> parse_endpoint(const std::string& endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon + 1 >= endpoint.size()) {
        return make_error(swarm_errc::invalid_argument, "endpoint must be host:port, got '" + endpoint + "'");
    }
    auto host = endpoint.substr(0, colon);
    auto port_text = endpoint.substr(colon + 1);
    for (char c : port_text) {
        if (c < '0' || c > '9') {
            return make_error(swarm_errc::invalid_argument, "invalid port in endpoint '" + endpoint + "'");
        }
    }
    long port = std::strtol(port_text.c_str(), nullptr, 10);
    if (port_text.size() > 5 || port <= 0 || port > 65535) {
        return make_error(swarm_errc::invalid_argument, "port out of range in endpoint '" + endpoint + "'");
    }
    if (host.empty()) {
        host = "0.0.0.0";
    }
    return std::make_pair(host, static_cast<uint16_t>(port));
}

} // namespace engine
} // namespace agentswarm
