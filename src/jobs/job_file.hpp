#pragma once

#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "job.hpp"
#include "job_collection.hpp"

// Job status file, rewritten by whatever runs the jobs:
//
//   jobs:
//     - name: fit_1
//       status: running        # configured|running|success|failed|cancelled
//       type: batch            # batch|local
//       tags: [fit, mc16a]
Result<std::vector<Job>> load_job_file(const std::filesystem::path& path);

// Re-read the status file and apply status changes to known jobs.
// Returns the number of jobs whose status changed.
Result<int> refresh_statuses(JobCollection& jobs, const std::filesystem::path& path);
