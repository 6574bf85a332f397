#include "../include/job_poller.hpp"
#include "../include/errors.hpp"
#include <iostream>
#include <thread>

using std::chrono::duration_cast;
using std::chrono::milliseconds;

namespace {
// Progress line every Nth non-terminal poll; one a minute at the default cadence.
constexpr int kProgressEvery = 12;

double seconds(milliseconds d) {
    return d.count() / 1000.0;
}
}

JobPoller::JobPoller(ProviderClient& provider, PollerConfig cfg, Clock clock, Sleeper sleep)
    : provider_(provider), cfg_(cfg), clock_(std::move(clock)), sleep_(std::move(sleep)) {
    if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
    if (!sleep_) sleep_ = [](milliseconds d) { std::this_thread::sleep_for(d); };
}

Job JobPoller::run(const SynthesisRequest& request) {
    Job job;
    try {
        job.id = provider_.submit(request);
    } catch (const ProviderUnavailable& e) {
        job.state = JobState::Failed;
        job.error_detail = e.what();
    } catch (const ProviderRejected& e) {
        job.state = JobState::Failed;
        job.error_detail = e.what();
    }
    if (job.state == JobState::Failed) {
        std::cerr << "[poller] Submit failed: " << *job.error_detail << std::endl;
        return job;
    }

    job.state = JobState::Submitted;
    const auto start = clock_();
    std::cout << "[poller] Job " << job.id << " submitted; budget " << seconds(cfg_.budget)
              << "s, interval " << seconds(cfg_.interval) << "s" << std::endl;

    for (;;) {
        job.elapsed = duration_cast<milliseconds>(clock_() - start);
        if (job.elapsed >= cfg_.budget) {
            job.state = JobState::TimedOut;
            break;
        }

        ++job.polls;
        try {
            // A hung request must not carry the job past its budget.
            apply(job, provider_.poll(job.id, cfg_.budget - job.elapsed));
        } catch (const ProviderUnavailable& e) {
            ++job.transient_failures;
            std::cerr << "[poller] Job " << job.id << " poll " << job.polls
                      << " failed, retrying: " << e.what() << std::endl;
        } catch (const ProviderRejected& e) {
            job.state = JobState::Failed;
            job.error_detail = e.what();
        }
        if (is_terminal(job.state)) break;

        if (job.polls % kProgressEvery == 1) {
            std::cout << "[poller] Job " << job.id << " " << to_string(job.state) << " after "
                      << seconds(job.elapsed) << "s" << std::endl;
        }
        sleep_(cfg_.interval);
    }

    job.elapsed = duration_cast<milliseconds>(clock_() - start);
    std::cout << "[poller] Job " << job.id << " " << to_string(job.state) << " after " << job.polls
              << " polls (" << job.transient_failures << " transient failures), "
              << seconds(job.elapsed) << "s" << std::endl;
    return job;
}

void JobPoller::apply(Job& job, const PollOutcome& outcome) const {
    switch (outcome.state) {
        case JobState::Succeeded:
            if (outcome.artifact_url && !outcome.artifact_url->empty()) {
                job.state = JobState::Succeeded;
                job.artifact_url = outcome.artifact_url;
            } else {
                job.state = JobState::Failed;
                job.error_detail = "Job succeeded but no result URL found";
            }
            return;
        case JobState::Failed:
            job.state = JobState::Failed;
            job.error_detail = outcome.error_detail.value_or("Avatar job failed");
            return;
        case JobState::Submitted:
        case JobState::Running:
        case JobState::TimedOut: // only the budget check may time a job out
            job.state = JobState::Running;
            return;
    }
}
