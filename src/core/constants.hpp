#pragma once

// ── Scripts ─────────────────────────────────────────────────
constexpr const char* DEFAULT_SHEBANG        = "#!/bin/bash";
constexpr const char* SLURM_OPTIONS_ID       = "SBATCH";

// ── Container isolation guard ───────────────────────────────
// Set inside the container; an unset marker means "not yet re-executed".
constexpr const char* CONTAINER_SENTINEL     = "SINGULARITY_INIT";
constexpr const char* DEFAULT_CONTAINER_RUNTIME = "singularity";

// Use fmt::format with this: fmt::format(GUARD_TEMPLATE, sentinel, runtime, image)
constexpr const char* GUARD_TEMPLATE =
    "if [[ -z \"${0}\" ]]\n"
    "then\n"
    "  {1} exec {2} \"$0\" \"$@\"\n"
    "  exit $?\n"
    "fi\n";

// ── Printer ─────────────────────────────────────────────────
constexpr int BASE_VERBOSITY                 = 1;
constexpr int DEFAULT_BAR_WIDTH              = 30;
constexpr int DEFAULT_POLL_INTERVAL_MS       = 1000;
constexpr const char* MANUAL_MODE_HINT       = " - press enter to update status";

// ── Paths ───────────────────────────────────────────────────
constexpr const char* DEFAULT_SCRIPT_DIR     = "scripts";
constexpr const char* LOG_FILE_NAME          = "batchy_debug.log";
constexpr const char* LOG_PATH_ENV           = "BATCHY_LOG";

constexpr const char* BATCHY_VERSION         = "0.2.0";
