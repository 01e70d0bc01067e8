#pragma once

#include "backend.hpp"

// HTCondor backend. Options go into the submit description, not the script,
// so there are no directive lines.
class HTCondorBackend : public Backend {
public:
    explicit HTCondorBackend(BackendConfig config = {}, HTCondorOptions options = {});

    const HTCondorOptions& options() const { return options_; }
    HTCondorOptions& options() { return options_; }

    // Submit description file contents for the prepared run script.
    std::string submit_description() const;

protected:
    int sync_options(const Backend& other) override;
    void describe_options(std::vector<std::pair<std::string, std::string>>& rows) const override;

private:
    HTCondorOptions options_;
};
