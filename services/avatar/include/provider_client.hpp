#pragma once
#include "synthesis.hpp"
#include "../../../shared/cpp/http/include/http.hpp"
#include <chrono>
#include <string>

// Talks to the rendering provider. No retry policy lives here;
// implementations must be safe to call from several request threads at once.
class ProviderClient {
public:
    virtual ~ProviderClient() = default;
    // Returns the provider job id. Throws ProviderUnavailable or ProviderRejected.
    virtual std::string submit(const SynthesisRequest& request) = 0;
    // `timeout` bounds this one request. Throws ProviderUnavailable on
    // transport trouble, ProviderRejected on 4xx.
    virtual PollOutcome poll(const std::string& job_id, std::chrono::milliseconds timeout) = 0;
};

struct AzureAvatarConfig {
    std::string endpoint; // e.g. https://westeurope.api.cognitive.microsoft.com
    std::string speech_key;
    std::string api_version{"2024-08-01"};
    long timeout_ms{30000};
};

// Native status vocabulary of the batch avatar synthesis API.
enum class ProviderStatus {
    NotStarted,
    Running,
    Succeeded,
    Failed,
    Unknown,
};

ProviderStatus parse_provider_status(const std::string& status);
// Unknown maps to Running: keep polling rather than abandon a live job.
JobState to_job_state(ProviderStatus status);

std::string build_submit_body(const SynthesisRequest& request);
PollOutcome parse_poll_body(const std::string& body);

// Anything but 2xx throws: 1xx, 429 and 5xx as ProviderUnavailable,
// 3xx and the remaining 4xx as ProviderRejected.
void classify_submit_response(const HttpResponse& r);
PollOutcome classify_poll_response(const HttpResponse& r);

// The smaller of the configured request timeout and what the caller has left,
// never below 1 ms.
long request_timeout_ms(long configured_ms, std::chrono::milliseconds remaining);

class AzureAvatarClient : public ProviderClient {
public:
    explicit AzureAvatarClient(AzureAvatarConfig cfg);
    std::string submit(const SynthesisRequest& request) override;
    PollOutcome poll(const std::string& job_id, std::chrono::milliseconds timeout) override;

private:
    std::string job_url(const std::string& job_id) const;
    AzureAvatarConfig cfg_;
};
