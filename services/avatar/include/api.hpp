#pragma once
#include "orchestrator.hpp"
#include <map>
#include <string>

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers; // lower-cased names
    std::string body;
};

struct ApiReply {
    int status{200};
    std::string body;
};

// Transport-independent routing for the avatar service. Maps core failures
// onto status codes: InvalidInput 400, bad key 401, UpstreamError 502,
// TimeoutError 504, anything else 500.
class AvatarApi {
public:
    AvatarApi(std::string api_key, AvatarOrchestrator& orchestrator);
    ApiReply handle(const ApiRequest& req);

private:
    ApiReply generate_avatar(const ApiRequest& req);
    bool authorized(const ApiRequest& req, const std::string& body_key) const;

    std::string api_key_;
    AvatarOrchestrator& orchestrator_;
};
