#include "../include/orchestrator.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <iostream>
#include <sstream>

namespace {
// 600000 ms -> "600s", 500 ms -> "0.5s"
std::string seconds_label(std::chrono::milliseconds d) {
    std::ostringstream oss;
    oss << std::chrono::duration<double>(d).count() << "s";
    return oss.str();
}
}

AvatarOrchestrator::AvatarOrchestrator(ProviderClient& provider, StorageRelay& storage, PollerConfig cfg,
                                       JobPoller::Clock clock, JobPoller::Sleeper sleep)
    : provider_(provider), storage_(storage), cfg_(cfg), clock_(std::move(clock)), sleep_(std::move(sleep)) {}

GenerateResult AvatarOrchestrator::generate(const SynthesisRequest& request) {
    if (trim(request.text).empty()) throw InvalidInput("Missing 'text' field");

    JobPoller poller(provider_, cfg_, clock_, sleep_);
    Job job = poller.run(request);

    switch (job.state) {
        case JobState::Succeeded:
            break;
        case JobState::Failed:
            throw UpstreamError(job.error_detail.value_or("Avatar job failed"));
        case JobState::TimedOut:
            throw TimeoutError("Avatar job " + job.id + " did not finish within " + seconds_label(cfg_.budget));
        case JobState::Submitted:
        case JobState::Running:
            throw std::logic_error("poller returned non-terminal job " + job.id);
    }

    GenerateResult res;
    res.job_id = job.id;
    try {
        res.artifact_url = storage_.upload(*job.artifact_url);
    } catch (const StorageError& e) {
        throw UpstreamError(std::string("Storage upload failed: ") + e.what());
    }
    std::cout << "[avatar] Job " << job.id << " relayed to " << res.artifact_url << std::endl;
    return res;
}
