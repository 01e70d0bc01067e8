#include "backend_factory.hpp"
#include "slurm_backend.hpp"
#include "htcondor_backend.hpp"
#include "local_backend.hpp"

std::unique_ptr<Backend> make_backend(const BackendSpec& spec) {
    std::unique_ptr<Backend> backend;
    switch (spec.kind) {
        case BackendKind::Slurm:
            backend = std::make_unique<SlurmBackend>(spec.config, spec.slurm);
            break;
        case BackendKind::HTCondor:
            backend = std::make_unique<HTCondorBackend>(spec.config, spec.htcondor);
            break;
        case BackendKind::Local:
            backend = std::make_unique<LocalBackend>(spec.config);
            break;
        case BackendKind::Base:
            backend = std::make_unique<Backend>(spec.config);
            break;
    }
    if (backend && !spec.container_runtime.empty()) {
        backend->set_container_runtime(spec.container_runtime);
    }
    return backend;
}
