#include "sandbox/output_filter.hpp"

#include <algorithm>
#include <regex>

namespace sandcell::sandbox {
namespace {

std::size_t CountLines(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    auto lines = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    if (text.back() != '\n') {
        ++lines;
    }
    return lines;
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::string StripAnsi(const std::string& text) {
    if (text.find('\x1B') == std::string::npos) {
        return text;
    }
    static const std::regex kAnsi(R"(\x1B(?:[@-Z\\-_]|\[[0-?]*[ -/]*[@-~]))");
    return std::regex_replace(text, kAnsi, "");
}

OutputLimiter::OutputLimiter(OutputLimits limits)
    : limits_(std::move(limits)) {}

std::string OutputLimiter::RenderNotice(const std::string& stream,
                                        std::size_t removed_lines,
                                        std::size_t removed_bytes) const {
    auto notice = limits_.truncation_notice;
    ReplaceAll(notice, "{stream}", stream);
    ReplaceAll(notice, "{removed_lines}", std::to_string(removed_lines));
    ReplaceAll(notice, "{removed_bytes}", std::to_string(removed_bytes));
    ReplaceAll(notice, "{max_lines}", std::to_string(limits_.max_lines));
    ReplaceAll(notice, "{max_bytes}", std::to_string(limits_.max_bytes));
    return notice;
}

LimitedOutput OutputLimiter::Apply(const std::string& text, const std::string& stream) const {
    LimitedOutput out{};
    std::size_t keep = text.size();

    if (limits_.max_lines > 0) {
        std::size_t seen = 0;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n' && ++seen == limits_.max_lines) {
                keep = std::min(keep, i + 1);
                break;
            }
        }
    }
    if (limits_.max_bytes > 0 && keep > limits_.max_bytes) {
        keep = limits_.max_bytes;
        const auto newline = text.rfind('\n', keep - 1);
        if (newline != std::string::npos) {
            keep = newline + 1;
        } else {
            // Never split a UTF-8 sequence.
            while (keep > 0 && IsContinuationByte(text[keep])) {
                --keep;
            }
        }
    }

    if (keep >= text.size()) {
        out.text = text;
        return out;
    }
    out.text = text.substr(0, keep);
    out.truncated = true;
    out.removed_bytes = text.size() - keep;
    out.removed_lines = CountLines(text) - CountLines(out.text);
    out.text += RenderNotice(stream, out.removed_lines, out.removed_bytes);
    return out;
}

}  // namespace sandcell::sandbox
