#pragma once

#include <cstddef>
#include <string>

namespace sandcell::sandbox {

std::string StripAnsi(const std::string& text);

inline constexpr const char* kDefaultTruncationNotice =
    "\n[{stream} truncated: {removed_lines} more lines ({removed_bytes} bytes) omitted; "
    "limit is {max_lines} lines / {max_bytes} bytes]";

struct OutputLimits {
    std::size_t max_lines = 1000;
    std::size_t max_bytes = 64 * 1024;
    // Placeholders: {stream} {removed_lines} {removed_bytes} {max_lines} {max_bytes}
    std::string truncation_notice = kDefaultTruncationNotice;
};

struct LimitedOutput {
    std::string text;
    bool truncated = false;
    std::size_t removed_lines = 0;
    std::size_t removed_bytes = 0;
};

class OutputLimiter {
public:
    explicit OutputLimiter(OutputLimits limits);

    // Keeps at most max_lines lines and max_bytes bytes of `text`, cutting
    // on a line boundary when one exists, then appends the rendered notice.
    LimitedOutput Apply(const std::string& text, const std::string& stream) const;

    std::string RenderNotice(const std::string& stream, std::size_t removed_lines, std::size_t removed_bytes) const;

private:
    OutputLimits limits_;
};

}  // namespace sandcell::sandbox
