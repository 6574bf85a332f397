#include "../include/config.hpp"
#include "../include/util.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {
std::string require_env(const char* key) {
    std::string v = getenv_or(key, "");
    if (v.empty()) throw std::runtime_error(std::string("Missing env var: ") + key);
    return v;
}

// Keeps seconds -> milliseconds conversions far from overflow.
constexpr long kMaxSeconds = 7L * 24 * 3600;
constexpr long kMaxPort = 65535;

long parse_bounded(const std::string& what, const std::string& v, long max) {
    try {
        size_t used = 0;
        long n = std::stol(v, &used);
        if (used == v.size() && n > 0 && n <= max) return n;
    } catch (const std::logic_error&) {
    }
    throw std::runtime_error("Invalid value for " + what + ": '" + v + "' (expected 1.." + std::to_string(max) + ")");
}

long positive_env(const char* key, long def, long max) {
    std::string v = getenv_or(key, "");
    if (v.empty()) return def;
    return parse_bounded(key, v, max);
}

std::string unquote(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}
}

int load_dotenv(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) return 0;
    int set = 0;
    std::string line;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = unquote(trim(line.substr(eq + 1)));
        if (key.empty() || std::getenv(key.c_str())) continue;
        if (setenv(key.c_str(), val.c_str(), 0) == 0) ++set;
    }
    return set;
}

int parse_port(const std::string& value) {
    return static_cast<int>(parse_bounded("port", value, kMaxPort));
}

ServiceConfig load_config_from_env() {
    ServiceConfig cfg;
    cfg.api_key = require_env("API_KEY");
    cfg.azure.speech_key = require_env("AZURE_SPEECH_KEY");
    cfg.azure.endpoint = require_env("AZURE_AVATAR_ENDPOINT");
    while (!cfg.azure.endpoint.empty() && cfg.azure.endpoint.back() == '/') cfg.azure.endpoint.pop_back();
    cfg.cloudinary.cloud_name = require_env("CLOUDINARY_CLOUD_NAME");
    cfg.cloudinary.api_key = require_env("CLOUDINARY_API_KEY");
    cfg.cloudinary.api_secret = require_env("CLOUDINARY_API_SECRET");

    cfg.port = static_cast<int>(positive_env("AVATAR_PORT", cfg.port, kMaxPort));
    cfg.poller.budget = std::chrono::seconds(positive_env("AVATAR_JOB_TIMEOUT_S", 600, kMaxSeconds));
    cfg.poller.interval = std::chrono::seconds(positive_env("AVATAR_POLL_INTERVAL_S", 5, kMaxSeconds));
    return cfg;
}
