#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace contmon {

// Parse one ring-buffer line. Lines of the form "[  123.456789] text" carry a
// timestamp; everything else (continuation lines, malformed brackets, other
// formats) comes back untimestamped. Never fails.
LogEntry parseRingBufferLine(const std::string &line);

// Split the full `dmesg` output into entries, dropping empty lines.
LogBatch parseRingBufferOutput(const std::string &text);

/**
 * Compute the entries appended to the ring buffer since the last reported
 * watermark.
 *
 * - batch: the whole retained buffer, in buffer order.
 * - lastOffset: highest timestamp already reported in this boot epoch.
 *
 * Every timestamped entry strictly greater than lastOffset is returned, in
 * buffer order, and newOffset is the maximum of lastOffset and all timestamps
 * seen. Each entry is compared against lastOffset only, never against the
 * running maximum. Untimestamped entries are neither returned nor compared.
 */
ExtractionResult extractNewEntries(const LogBatch &batch, BootOffset lastOffset);

// Raw entry texts joined by '\n'; empty when there are none.
std::string joinEntries(const std::vector<LogEntry> &entries);

} // namespace contmon
