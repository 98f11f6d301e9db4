#pragma once

#include <string>

namespace voxrelay {

constexpr int kDefaultListenPort = 8765;
constexpr const char* kDefaultListenPath = "/api/vox/live";
constexpr int kDefaultMaxSessions = 8;
constexpr const char* kDefaultVoice = "Kore";

struct RelayConfig {
    std::string listen_address = "0.0.0.0";
    int listen_port = kDefaultListenPort;
    std::string listen_path = kDefaultListenPath;
    int max_sessions = kDefaultMaxSessions;

    std::string api_key;
    std::string model;
    std::string upstream_url;

    std::string catalog_path = "data/tool_catalog.json";
    std::string project_state_path;

    bool verbose = false;
};

// Reads GEMINI_API_KEY and the VOXRELAY_* variables over the defaults above.
RelayConfig LoadRelayConfigFromEnv();

// Unset, empty, "0", "false", "no" and "off" are disabled.
bool IsEnvEnabled(const char* name);
std::string EnvOr(const char* name, const std::string& fallback);
bool TryParsePort(const std::string& text, int* out);

// Persona theme to prebuilt upstream voice; unknown themes get kDefaultVoice.
std::string VoiceForTheme(const std::string& theme);

std::string DescribeConfig(const RelayConfig& config);

} // namespace voxrelay
