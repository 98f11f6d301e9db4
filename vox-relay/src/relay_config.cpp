#include "relay_config.h"

#include "gemini_live_protocol.h"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <unordered_map>

namespace voxrelay {

namespace {

bool TryParsePositiveInt(const std::string& text, int* out) {
    if (text.empty() || !out) {
        return false;
    }
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (!end || *end != '\0' || value <= 0 || value > 1000000) {
        return false;
    }
    *out = static_cast<int>(value);
    return true;
}

} // namespace

bool IsEnvEnabled(const char* name) {
    if (!name || *name == '\0') {
        return false;
    }
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0') {
        return false;
    }
    std::string value(raw);
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return !(value == "0" || value == "false" || value == "no" || value == "off");
}

std::string EnvOr(const char* name, const std::string& fallback) {
    const char* raw = name ? std::getenv(name) : nullptr;
    if (!raw || *raw == '\0') {
        return fallback;
    }
    return std::string(raw);
}

bool TryParsePort(const std::string& text, int* out) {
    int value = 0;
    if (!TryParsePositiveInt(text, &value) || value > 65535) {
        return false;
    }
    *out = value;
    return true;
}

RelayConfig LoadRelayConfigFromEnv() {
    RelayConfig config;
    config.api_key = EnvOr("GEMINI_API_KEY", "");
    config.listen_address = EnvOr("VOXRELAY_LISTEN_ADDRESS", config.listen_address);
    int port = 0;
    if (TryParsePort(EnvOr("VOXRELAY_LISTEN_PORT", ""), &port)) {
        config.listen_port = port;
    }
    int max_sessions = 0;
    if (TryParsePositiveInt(EnvOr("VOXRELAY_MAX_SESSIONS", ""), &max_sessions)) {
        config.max_sessions = max_sessions;
    }
    config.model = EnvOr("VOXRELAY_LIVE_MODEL", kDefaultLiveModel);
    config.upstream_url = EnvOr("VOXRELAY_UPSTREAM_URL", kDefaultUpstreamUrl);
    config.catalog_path = EnvOr("VOXRELAY_CATALOG_PATH", config.catalog_path);
    config.project_state_path = EnvOr("VOXRELAY_PROJECT_STATE_PATH", config.project_state_path);
    config.verbose = IsEnvEnabled("VOXRELAY_VERBOSE");
    return config;
}

std::string VoiceForTheme(const std::string& theme) {
    static const std::unordered_map<std::string, std::string> kThemeVoices = {
        {"expert", "Orus"},
        {"sharp", "Fenrir"},
        {"warm", "Aoede"},
        {"casual", "Kore"},
        {"future", "Puck"},
        {"minimal", "Zephyr"},
        {"retro", "Charon"},
        {"creative", "Leda"},
    };
    const auto it = kThemeVoices.find(theme);
    return it == kThemeVoices.end() ? kDefaultVoice : it->second;
}

std::string DescribeConfig(const RelayConfig& config) {
    std::ostringstream oss;
    oss << "listen=" << config.listen_address << ":" << config.listen_port << config.listen_path
        << " max_sessions=" << config.max_sessions << " model=" << config.model
        << " api_key=" << (config.api_key.empty() ? "missing" : "set")
        << " catalog=" << config.catalog_path
        << " project_state=" << (config.project_state_path.empty() ? "none" : config.project_state_path)
        << " verbose=" << (config.verbose ? "true" : "false");
    return oss.str();
}

} // namespace voxrelay
