#include "daemon/reboot_detector.hpp"

#include <cctype>
#include <fstream>

namespace contmon {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

} // namespace

std::string readBootId(const std::string &path)
{
    std::ifstream in(path);
    if (!in) {
        return kUnknownBootId;
    }

    std::string line;
    std::getline(in, line);
    line = trim(line);
    if (line.empty()) {
        return kUnknownBootId;
    }
    return line;
}

RebootCheckResult checkAndMaybeReset(const std::string &currentBootId,
                                     const Checkpoint &checkpoint)
{
    const std::string bootId = currentBootId.empty()
        ? std::string(kUnknownBootId)
        : currentBootId;

    RebootCheckResult result;
    if (bootId != checkpoint.bootId) {
        result.checkpoint.bootId = bootId;
        result.checkpoint.lastLogOffset = BootOffset{0};
        result.resetOccurred = true;
        return result;
    }

    result.checkpoint = checkpoint;
    return result;
}

} // namespace contmon
