#include "daemon/kmsg_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include "common/json_utils.hpp"

namespace contmon {

namespace {

bool isBlank(char ch)
{
    return ch == ' ' || ch == '\t';
}

bool isDigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

// Accepts "[", optional blanks, digits, ".", digits, optional blanks, "]".
std::optional<BootOffset> parseLeadingTimestamp(const std::string &line)
{
    if (line.empty() || line.front() != '[') {
        return std::nullopt;
    }

    const size_t close = line.find(']');
    if (close == std::string::npos) {
        return std::nullopt;
    }

    const std::string inner = line.substr(1, close - 1);

    // The kernel always prints a fractional part; "[123]" is not a timestamp.
    const size_t dot = inner.find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    size_t start = 0;
    while (start < inner.size() && isBlank(inner[start])) {
        ++start;
    }
    if (start >= dot || !isDigit(inner[dot - 1])
        || dot + 1 >= inner.size() || !isDigit(inner[dot + 1])) {
        return std::nullopt;
    }

    return parseBootOffset(inner);
}

} // namespace

LogEntry parseRingBufferLine(const std::string &line)
{
    LogEntry entry;
    entry.rawText = line;
    entry.timestamp = parseLeadingTimestamp(line);
    return entry;
}

LogBatch parseRingBufferOutput(const std::string &text)
{
    LogBatch batch;

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }

        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            batch.push_back(parseRingBufferLine(line));
        }

        start = end + 1;
    }

    return batch;
}

ExtractionResult extractNewEntries(const LogBatch &batch, BootOffset lastOffset)
{
    ExtractionResult result;
    result.newOffset = lastOffset;

    for (const LogEntry &entry : batch) {
        if (!entry.timestamp.has_value()) {
            continue;
        }

        const BootOffset ts = *entry.timestamp;
        if (ts > lastOffset) {
            result.newEntries.push_back(entry);
        }
        result.newOffset = std::max(result.newOffset, ts);
    }

    return result;
}

std::string joinEntries(const std::vector<LogEntry> &entries)
{
    std::string joined;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += entries[i].rawText;
    }
    return joined;
}

} // namespace contmon
