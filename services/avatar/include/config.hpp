#pragma once
#include "job_poller.hpp"
#include "provider_client.hpp"
#include "storage_relay.hpp"
#include <filesystem>
#include <string>

struct ServiceConfig {
    int port{3300};
    std::string api_key; // what clients must send as X-API-Key
    AzureAvatarConfig azure;
    CloudinaryConfig cloudinary;
    PollerConfig poller;
};

// Sets KEY=VALUE pairs from `path` that are not already in the environment.
// Returns the number of variables set; a missing file sets none.
int load_dotenv(const std::filesystem::path& path);

// 1..65535; throws std::runtime_error otherwise.
int parse_port(const std::string& value);

// Throws std::runtime_error("Missing env var: NAME") for absent required settings.
ServiceConfig load_config_from_env();
