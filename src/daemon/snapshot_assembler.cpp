#include "daemon/snapshot_assembler.hpp"

#include "common/json_utils.hpp"
#include "daemon/kmsg_parser.hpp"

namespace contmon {

MonitorSnapshot assembleSnapshot(const HostSample &host,
                                 const ExtractionResult &extraction,
                                 std::chrono::system_clock::time_point now)
{
    MonitorSnapshot snapshot;
    snapshot.hostname = host.hostname;
    snapshot.ipAddress = host.ipAddress;
    snapshot.timestamp = toIso8601WithOffset(now);
    snapshot.cpuInfo = host.cpuInfo;
    snapshot.memoryInfo = host.memoryInfo;
    snapshot.swapInfo = host.swapInfo;
    snapshot.threadInfo.clear();
    snapshot.dmesg = joinEntries(extraction.newEntries);
    return snapshot;
}

} // namespace contmon
