#pragma once

#include <chrono>

#include "common/models.hpp"

namespace contmon {

/**
 * Build the published snapshot from one cycle's results:
 * - host identity and the CPU/memory/swap text blocks, passed through as-is
 * - the newly observed ring-buffer entries, joined by newlines
 * - the cycle's wall-clock time, as ISO-8601 local time with UTC offset
 *
 * This function does not touch the system; threadInfo is always empty.
 */
MonitorSnapshot assembleSnapshot(const HostSample &host,
                                 const ExtractionResult &extraction,
                                 std::chrono::system_clock::time_point now);

} // namespace contmon
