#pragma once
#include "job_poller.hpp"
#include "provider_client.hpp"
#include "storage_relay.hpp"
#include "synthesis.hpp"
#include <string>

struct GenerateResult {
    std::string job_id;
    std::string artifact_url; // storage URL, not the provider's
};

// Entry point for the request layer. One generate() call is one submit plus a
// bounded number of polls; nothing is retried here. Voice/character/style are
// expected to be validated against the catalogs already.
class AvatarOrchestrator {
public:
    AvatarOrchestrator(ProviderClient& provider, StorageRelay& storage, PollerConfig cfg,
                       JobPoller::Clock clock = {}, JobPoller::Sleeper sleep = {});

    // Throws InvalidInput, UpstreamError or TimeoutError.
    GenerateResult generate(const SynthesisRequest& request);

private:
    ProviderClient& provider_;
    StorageRelay& storage_;
    PollerConfig cfg_;
    JobPoller::Clock clock_;
    JobPoller::Sleeper sleep_;
};
