#include "../include/api.hpp"
#include "../include/catalog.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace {
ApiReply reply(int status, const json& j) {
    // Provider error bodies are echoed back and are not guaranteed to be UTF-8.
    return {status, j.dump(-1, ' ', false, json::error_handler_t::replace)};
}

ApiReply error(int status, const std::string& msg) {
    return reply(status, json{{"error", msg}});
}

std::string string_field(const json& j, const char* key, const std::string& def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (!it->is_string()) throw InvalidInput(std::string("Field '") + key + "' must be a string");
    return it->get<std::string>();
}
}

AvatarApi::AvatarApi(std::string api_key, AvatarOrchestrator& orchestrator)
    : api_key_(std::move(api_key)), orchestrator_(orchestrator) {}

ApiReply AvatarApi::handle(const ApiRequest& req) {
    if (req.method == "OPTIONS") return {204, ""};
    if (req.method == "GET" && req.path == "/health") {
        return reply(200, json{{"status", "ok"}});
    }
    if (req.method == "GET" && req.path == "/models") {
        return reply(200, json{{"avatars", avatar_catalog()}});
    }
    if (req.method == "GET" && req.path == "/voices") {
        return reply(200, json{{"voices", voice_catalog()}});
    }
    if (req.method == "POST" && req.path == "/generate-avatar") {
        return generate_avatar(req);
    }
    return error(404, "not found");
}

bool AvatarApi::authorized(const ApiRequest& req, const std::string& body_key) const {
    auto it = req.headers.find("x-api-key");
    const std::string& provided = (it != req.headers.end() && !it->second.empty()) ? it->second : body_key;
    return !provided.empty() && constant_time_equals(provided, api_key_);
}

ApiReply AvatarApi::generate_avatar(const ApiRequest& req) {
    json data = json::parse(req.body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) data = json::object();

    std::string body_key;
    auto key = data.find("key");
    if (key != data.end() && key->is_string()) body_key = key->get<std::string>();
    if (!authorized(req, body_key)) {
        return error(401, "Invalid or missing API key");
    }

    try {
        SynthesisRequest sr;
        sr.text = trim(string_field(data, "text", ""));
        if (sr.text.empty()) return error(400, "Missing 'text' field");
        sr.voice = string_field(data, "voice", sr.voice);
        sr.avatar_character = string_field(data, "talkingAvatarCharacter", sr.avatar_character);
        sr.avatar_style = string_field(data, "talkingAvatarStyle", sr.avatar_style);
        std::string background = string_field(data, "background", "");
        if (!background.empty()) sr.background = background;

        if (auto err = validate_avatar_params(sr)) return error(400, *err);

        GenerateResult res = orchestrator_.generate(sr);
        return reply(200, json{{"success", true}, {"video_url", res.artifact_url}, {"job_id", res.job_id}});
    } catch (const InvalidInput& e) {
        return error(400, e.what());
    } catch (const TimeoutError& e) {
        std::cerr << "[avatar] Timeout: " << e.what() << std::endl;
        return error(504, e.what());
    } catch (const UpstreamError& e) {
        std::cerr << "[avatar] Upstream error: " << e.what() << std::endl;
        return error(502, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[avatar] Unexpected error: " << e.what() << std::endl;
        return error(500, std::string("Unexpected error: ") + e.what());
    }
}
