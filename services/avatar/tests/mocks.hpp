#pragma once
#include "../include/job_poller.hpp"
#include "../include/provider_client.hpp"
#include "../include/storage_relay.hpp"
#include <gmock/gmock.h>
#include <chrono>
#include <string>

class MockProviderClient : public ProviderClient {
public:
    MOCK_METHOD(std::string, submit, (const SynthesisRequest& request), (override));
    MOCK_METHOD(PollOutcome, poll, (const std::string& job_id, std::chrono::milliseconds timeout), (override));
};

class MockStorageRelay : public StorageRelay {
public:
    MOCK_METHOD(std::string, upload, (const std::string& source_url), (override));
};

// Simulated time: sleeping advances the clock instantly.
struct FakeTime {
    std::chrono::steady_clock::time_point now{};
    int sleeps{0};

    JobPoller::Clock clock() {
        return [this] { return now; };
    }
    JobPoller::Sleeper sleeper() {
        return [this](std::chrono::milliseconds d) { now += d; ++sleeps; };
    }
    std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point t) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - t);
    }
};

inline PollOutcome running() {
    return PollOutcome{JobState::Running, std::nullopt, std::nullopt};
}

inline PollOutcome succeeded(const std::string& url) {
    return PollOutcome{JobState::Succeeded, url, std::nullopt};
}

inline PollOutcome failed(const std::string& detail) {
    return PollOutcome{JobState::Failed, std::nullopt, detail};
}
