#pragma once

#include "backend.hpp"

// Runs jobs on this machine. Needs no scheduler commands.
class LocalBackend : public Backend {
public:
    explicit LocalBackend(BackendConfig config = {})
        : Backend(BackendKind::Local, "", {}, std::move(config)) {}
};
