#pragma once
#include "synthesis.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

using Catalog = std::map<std::string, std::vector<std::string>>;

const Catalog& avatar_catalog(); // character -> styles
const Catalog& voice_catalog();  // gender -> voices

// Returns a caller-facing error message, or nullopt when the request is valid.
std::optional<std::string> validate_avatar_params(const SynthesisRequest& request);
