#include "../include/provider_client.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "../../../shared/cpp/http/include/http.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <map>

using json = nlohmann::json;

namespace {
bool transient_status(long status) {
    return status < 200 || status == 429 || status >= 500;
}

void throw_unless_ok(const HttpResponse& r, const std::string& what) {
    if (r.ok()) return;
    std::string msg = what + " [" + std::to_string(r.status) + "]: " + r.body;
    if (transient_status(r.status)) throw ProviderUnavailable(msg);
    throw ProviderRejected(r.status, msg);
}

std::string failure_detail(const json& data) {
    const json* err = nullptr;
    if (data.contains("properties") && data["properties"].is_object() && data["properties"].contains("error")) {
        err = &data["properties"]["error"];
    } else if (data.contains("error")) {
        err = &data["error"];
    }
    if (err && err->is_object() && err->contains("message") && (*err)["message"].is_string()) {
        std::string msg = (*err)["message"].get<std::string>();
        if (err->contains("code") && (*err)["code"].is_string()) {
            return (*err)["code"].get<std::string>() + ": " + msg;
        }
        return msg;
    }
    return "Avatar job failed: " + data.dump(2);
}
}

ProviderStatus parse_provider_status(const std::string& status) {
    static const std::map<std::string, ProviderStatus> table = {
        {"NotStarted", ProviderStatus::NotStarted},
        {"Running", ProviderStatus::Running},
        {"Succeeded", ProviderStatus::Succeeded},
        {"Failed", ProviderStatus::Failed},
    };
    auto it = table.find(status);
    return it == table.end() ? ProviderStatus::Unknown : it->second;
}

JobState to_job_state(ProviderStatus status) {
    switch (status) {
        case ProviderStatus::NotStarted: return JobState::Submitted;
        case ProviderStatus::Running: return JobState::Running;
        case ProviderStatus::Succeeded: return JobState::Succeeded;
        case ProviderStatus::Failed: return JobState::Failed;
        case ProviderStatus::Unknown: break;
    }
    return JobState::Running;
}

std::string build_submit_body(const SynthesisRequest& request) {
    json avatar_config = {
        {"talkingAvatarCharacter", request.avatar_character},
        {"talkingAvatarStyle", request.avatar_style},
        {"customized", false},
        {"videoFormat", "mp4"},
        {"videoCodec", "h264"},
        {"subtitleType", "soft_embedded"},
        {"useBuiltInVoice", false}
    };
    if (request.background && !request.background->empty()) {
        avatar_config["backgroundImage"] = *request.background;
    } else {
        avatar_config["backgroundColor"] = "#FFFFFFFF";
    }
    json body = {
        {"inputKind", "PlainText"},
        {"synthesisConfig", {{"voice", request.voice}}},
        {"customVoices", json::object()},
        {"inputs", json::array({json{{"content", request.text}}})},
        {"avatarConfig", avatar_config}
    };
    return body.dump();
}

PollOutcome parse_poll_body(const std::string& body) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ProviderUnavailable(std::string("unparseable status response: ") + e.what());
    }
    if (!data.is_object()) throw ProviderUnavailable("status response is not a JSON object");

    std::string raw = data.contains("status") && data["status"].is_string() ? data["status"].get<std::string>() : "";
    PollOutcome out;
    out.state = to_job_state(parse_provider_status(raw));
    if (out.state == JobState::Succeeded) {
        if (data.contains("outputs") && data["outputs"].is_object()) {
            const auto& outputs = data["outputs"];
            if (outputs.contains("result") && outputs["result"].is_string() &&
                !outputs["result"].get<std::string>().empty()) {
                out.artifact_url = outputs["result"].get<std::string>();
            }
        }
    } else if (out.state == JobState::Failed) {
        out.error_detail = failure_detail(data);
    }
    return out;
}

void classify_submit_response(const HttpResponse& r) {
    throw_unless_ok(r, "Azure job creation failed");
}

PollOutcome classify_poll_response(const HttpResponse& r) {
    throw_unless_ok(r, "Azure status query failed");
    return parse_poll_body(r.body);
}

long request_timeout_ms(long configured_ms, std::chrono::milliseconds remaining) {
    // curl treats 0 as "no timeout"
    return std::max<long>(1, std::min<long>(configured_ms, static_cast<long>(remaining.count())));
}

AzureAvatarClient::AzureAvatarClient(AzureAvatarConfig cfg) : cfg_(std::move(cfg)) {
    while (!cfg_.endpoint.empty() && cfg_.endpoint.back() == '/') cfg_.endpoint.pop_back();
}

std::string AzureAvatarClient::job_url(const std::string& job_id) const {
    return cfg_.endpoint + "/avatar/batchsyntheses/" + job_id + "?api-version=" + cfg_.api_version;
}

std::string AzureAvatarClient::submit(const SynthesisRequest& request) {
    std::string job_id = gen_uuid_v4();
    HttpResponse r;
    try {
        r = http_put_json(job_url(job_id), build_submit_body(request),
                          {"Ocp-Apim-Subscription-Key: " + cfg_.speech_key}, cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw ProviderUnavailable(std::string("Azure job creation failed: ") + e.what());
    }
    classify_submit_response(r);
    std::cout << "[azure] Created job " << job_id << " (" << request.avatar_character << "/"
              << request.avatar_style << ", " << request.voice << ")" << std::endl;
    return job_id;
}

PollOutcome AzureAvatarClient::poll(const std::string& job_id, std::chrono::milliseconds timeout) {
    HttpResponse r;
    try {
        r = http_get(job_url(job_id), {"Ocp-Apim-Subscription-Key: " + cfg_.speech_key},
                     request_timeout_ms(cfg_.timeout_ms, timeout));
    } catch (const HttpTransportError& e) {
        throw ProviderUnavailable(std::string("Azure status query failed: ") + e.what());
    }
    return classify_poll_response(r);
}
