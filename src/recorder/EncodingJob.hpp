#pragma once
// EncodingJob.hpp - Job lifecycle state and progress snapshots

#include <filesystem>
#include <optional>
#include <string>
#include "util/Result.hpp"

namespace lf {

// Queued -> Analyzing -> Rendering -> Encoding -> Done, or Failed from any
enum class JobState { Queued, Analyzing, Rendering, Encoding, Done, Failed };

inline const char* jobStateName(JobState state) {
    switch (state) {
    case JobState::Queued:
        return "queued";
    case JobState::Analyzing:
        return "analyzing";
    case JobState::Rendering:
        return "rendering";
    case JobState::Encoding:
        return "encoding";
    case JobState::Done:
        return "done";
    case JobState::Failed:
        return "failed";
    }
    return "unknown";
}

inline bool isTerminal(JobState state) {
    return state == JobState::Done || state == JobState::Failed;
}

struct EncodingJob {
    JobState state{JobState::Queued};
    u64 framesExpected{0};
    u64 framesEncoded{0};
    std::optional<Error> lastError;
    std::filesystem::path outputPath;
    std::string activeBackend;
    bool fellBack{false};
    u64 fallbackFrame{0}; // first frame encoded after a fallback
};

struct ProgressEvent {
    u64 framesEncoded{0};
    u64 framesExpected{0};
    JobState state{JobState::Queued};
};

} // namespace lf
