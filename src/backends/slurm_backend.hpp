#pragma once

#include <string>
#include <vector>
#include "backend.hpp"

// SLURM backend. Directive lines are "#SBATCH ..." comments.
class SlurmBackend : public Backend {
public:
    explicit SlurmBackend(BackendConfig config = {}, SlurmOptions options = {});

    const SlurmOptions& options() const { return options_; }
    SlurmOptions& options() { return options_; }

    // sbatch arguments for the configured options, followed by run_args and
    // the run script (no process is started).
    std::vector<std::string> submit_args() const;

protected:
    int sync_options(const Backend& other) override;
    void describe_options(std::vector<std::pair<std::string, std::string>>& rows) const override;

private:
    SlurmOptions options_;
};
