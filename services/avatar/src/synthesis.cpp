#include "../include/synthesis.hpp"

const char* to_string(JobState s) {
    switch (s) {
        case JobState::Submitted: return "Submitted";
        case JobState::Running: return "Running";
        case JobState::Succeeded: return "Succeeded";
        case JobState::Failed: return "Failed";
        case JobState::TimedOut: return "TimedOut";
    }
    return "Unknown";
}

bool is_terminal(JobState s) {
    return s == JobState::Succeeded || s == JobState::Failed || s == JobState::TimedOut;
}
