#pragma once

#include <string>
#include <vector>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns exit code, -1 if it did not exit normally.
    int wait();

private:
    int pid_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool discard_output);
};

// Spawn a child process (PATH lookup via execvp).
// discard_output: redirect the child's stdout and stderr to /dev/null.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool discard_output = false);

// Spawn with output discarded and wait. Returns the exit code, -1 if spawn failed.
int run_quiet(const std::string& program, const std::vector<std::string>& args);

} // namespace platform
