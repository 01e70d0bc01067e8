#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Whether batch submission is live or disabled for this run.
enum class ExecutionMode {
    Normal,
    Test,       // batch submission disabled (e.g. scheduler tools missing)
};

// Asks the user a yes/no question. Returns true on consent.
using DecisionCallback = std::function<bool(const std::string&)>;

// Per-run context handed to operations that read or change the execution mode.
struct RunContext {
    ExecutionMode mode = ExecutionMode::Normal;
    DecisionCallback decide;

    bool test_mode() const { return mode == ExecutionMode::Test; }
};

// Printer rendering strategy, chosen once per run.
enum class ReportMode {
    Bars,         // one progress bar per tag plus one for all jobs
    Line,         // single status line rewritten in place
    ManualLine,   // like Line, with a hint for manual status refresh
};
