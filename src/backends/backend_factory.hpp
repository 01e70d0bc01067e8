#pragma once

#include <memory>
#include "backend.hpp"

// Everything needed to build one backend, as read from config.
struct BackendSpec {
    BackendKind kind = BackendKind::Base;
    BackendConfig config;
    SlurmOptions slurm;
    HTCondorOptions htcondor;
    std::string container_runtime;   // empty = default runtime
};

std::unique_ptr<Backend> make_backend(const BackendSpec& spec);
