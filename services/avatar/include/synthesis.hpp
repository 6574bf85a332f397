#pragma once
#include <string>
#include <optional>
#include <chrono>

struct SynthesisRequest {
    std::string text;
    std::string voice{"th-TH-NiwatNeural"};
    std::string avatar_character{"harry"};
    std::string avatar_style{"casual"};
    std::optional<std::string> background; // image URL; solid white when unset
};

enum class JobState {
    Submitted,
    Running,
    Succeeded,
    Failed,
    TimedOut,
};

const char* to_string(JobState s);
bool is_terminal(JobState s);

// What a single status query reported.
struct PollOutcome {
    JobState state{JobState::Running};
    std::optional<std::string> artifact_url;
    std::optional<std::string> error_detail;
};

struct Job {
    std::string id;
    JobState state{JobState::Submitted};
    std::optional<std::string> artifact_url; // set only when Succeeded
    std::optional<std::string> error_detail; // set only when Failed
    int polls{0};
    int transient_failures{0};
    std::chrono::milliseconds elapsed{0};
};
