#pragma once

#include <string>
#include <vector>
#include "models/Job.h"
#include "../common/Result.h"

namespace archive_engine::crawler {

/**
 * @brief Builds a new job from `add` command arguments:
 * `<page|video|snapshot> <url> [intervalDays] [depth] [--external]`.
 *
 * `--external` may appear anywhere and is only valid for page mirrors.
 * The job comes back without an ID; the registry assigns one.
 */
common::Result<Job> jobFromArguments(const std::vector<std::string>& args);

} // namespace archive_engine::crawler
