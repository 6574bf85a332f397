#pragma once
#include "provider_client.hpp"
#include "synthesis.hpp"
#include <chrono>
#include <functional>

struct PollerConfig {
    std::chrono::milliseconds budget{std::chrono::seconds(600)};
    std::chrono::milliseconds interval{std::chrono::seconds(5)};
};

// Drives one job from submission to a terminal state:
//
//   Idle -> Submitted -> Running -> {Succeeded | Failed | TimedOut}
//
// The budget is checked before every poll, so once it is spent no further
// provider calls are made. Transport failures while polling are absorbed and
// only end the job through the budget (TimedOut); a failed submit ends it
// Failed straight away with zero polls.
class JobPoller {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Empty clock/sleeper default to steady_clock and this_thread::sleep_for.
    JobPoller(ProviderClient& provider, PollerConfig cfg, Clock clock = {}, Sleeper sleep = {});

    Job run(const SynthesisRequest& request);

private:
    void apply(Job& job, const PollOutcome& outcome) const;

    ProviderClient& provider_;
    PollerConfig cfg_;
    Clock clock_;
    Sleeper sleep_;
};
