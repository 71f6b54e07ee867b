#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"
#include "daemon/reboot_detector.hpp"

namespace contmon {

// Collaborators the monitor samples every cycle. Implementations degrade to
// empty values instead of failing; the daemon never aborts a cycle on them.

class BootIdSource {
public:
    virtual ~BootIdSource() = default;
    virtual std::string currentBootId() = 0;
};

class LogSource {
public:
    virtual ~LogSource() = default;
    // The entire current ring buffer. Empty when the source is unavailable.
    virtual LogBatch readBuffer() = 0;
};

class HostSampler {
public:
    virtual ~HostSampler() = default;
    virtual HostSample sample() = 0;
};

class ProcBootIdSource : public BootIdSource {
public:
    explicit ProcBootIdSource(std::string path = kBootIdPath);
    std::string currentBootId() override;

private:
    std::string m_path;
};

// Runs `dmesg --color=never`.
class DmesgLogSource : public LogSource {
public:
    LogBatch readBuffer() override;
};

// Reads a saved ring-buffer dump; used for replays and CONTMON_DMESG_PATH.
class FileLogSource : public LogSource {
public:
    explicit FileLogSource(QString path);
    LogBatch readBuffer() override;

private:
    QString m_path;
};

// hostname/IP via gethostname, `hostname -I` and `ip route get 1`; CPU, memory
// and swap summary lines from `top -b -n 1`.
class CommandHostSampler : public HostSampler {
public:
    HostSample sample() override;
};

struct TopSummary {
    std::string cpuInfo;
    std::string memoryInfo;
    std::string swapInfo;
};

// Picks the "%Cpu", "Mem :" and "Swap:" lines out of the `top` header.
TopSummary parseTopSummary(const QString &topOutput);

// First address printed by `hostname -I`.
std::string parseHostnameIOutput(const QString &output);

// Address following "src" in `ip route get 1`.
std::string parseIpRouteOutput(const QString &output);

} // namespace contmon
