#pragma once

#include <string>

#include "common/models.hpp"

namespace contmon {

inline constexpr const char *kBootIdPath = "/proc/sys/kernel/random/boot_id";

struct RebootCheckResult {
    Checkpoint checkpoint;
    bool resetOccurred = false;
};

// Reads the kernel boot id. Returns "unknown" when the file is missing,
// unreadable or empty.
std::string readBootId(const std::string &path = kBootIdPath);

/**
 * Compare the current boot id against the one stored in the checkpoint.
 *
 * An empty currentBootId is treated as "unknown". When it differs from
 * checkpoint.bootId the result carries {currentBootId, 0} and resetOccurred;
 * otherwise the checkpoint is returned unchanged.
 */
RebootCheckResult checkAndMaybeReset(const std::string &currentBootId,
                                     const Checkpoint &checkpoint);

} // namespace contmon
