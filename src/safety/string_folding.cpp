#include "safety/string_folding.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <unordered_set>
#include <vector>

#include <openssl/evp.h>

namespace sandcell::safety {
namespace {

constexpr std::size_t kMaxFoldedLength = 4096;

void AppendCodePoint(std::string& out, long long code_point) {
    const auto cp = static_cast<unsigned long>(code_point);
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::optional<std::string> Checked(std::string value) {
    if (value.size() > kMaxFoldedLength) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> DecodeBase64(std::string text, bool urlsafe) {
    text.erase(std::remove_if(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
    }), text.end());
    if (urlsafe) {
        std::replace(text.begin(), text.end(), '-', '+');
        std::replace(text.begin(), text.end(), '_', '/');
    }
    while (text.size() % 4 != 0) {
        text.push_back('=');
    }
    if (text.empty()) {
        return std::string();
    }
    std::vector<unsigned char> buffer(text.size() / 4 * 3 + 1);
    const int written = EVP_DecodeBlock(buffer.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }
    std::size_t length = static_cast<std::size_t>(written);
    // EVP_DecodeBlock counts padding as zero bytes.
    for (auto it = text.rbegin(); it != text.rend() && *it == '=' && length > 0; ++it) {
        --length;
    }
    return std::string(reinterpret_cast<const char*>(buffer.data()), length);
}

int HexDigit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

std::optional<std::string> DecodeHex(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }
    std::string out;
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        const int high = HexDigit(digits[i]);
        const int low = HexDigit(digits[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(high * 16 + low));
    }
    return out;
}

std::string Rot13(std::string text) {
    for (auto& c : text) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>('a' + (c - 'a' + 13) % 26);
        } else if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>('A' + (c - 'A' + 13) % 26);
        }
    }
    return text;
}

bool IsBase64Decoder(const std::string& name) {
    static const std::unordered_set<std::string> kNames = {
        "b64decode", "standard_b64decode", "urlsafe_b64decode", "decodebytes", "a2b_base64"
    };
    return kNames.count(name) > 0;
}

bool IsHexDecoder(const std::string& name) {
    return name == "b16decode" || name == "unhexlify" || name == "a2b_hex" || name == "fromhex";
}

bool IsCodecsDecode(const Node& call) {
    const auto* func = call.Child(0);
    return func && func->kind == NodeKind::kAttribute && func->text == "decode" &&
           func->Child(0) && func->Child(0)->IsName("codecs");
}

std::optional<std::string> ApplyCodec(const std::string& data, const std::string& codec) {
    std::string name = codec;
    std::replace(name.begin(), name.end(), '-', '_');
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (name == "rot13" || name == "rot_13") {
        return Rot13(data);
    }
    if (name == "hex" || name == "hex_codec") {
        return DecodeHex(data);
    }
    if (name == "base64" || name == "base_64" || name == "base64_codec") {
        return DecodeBase64(data, false);
    }
    if (name.empty() || name == "utf8" || name == "utf_8" || name == "ascii" ||
        name == "latin_1" || name == "unicode_escape") {
        return name == "unicode_escape" ? DecodeStringEscapes(data, false) : data;
    }
    return std::nullopt;
}

// First positional argument of a call, skipping keywords and starred values.
const Node* PositionalArgument(const Node& call, std::size_t index) {
    std::size_t seen = 0;
    for (std::size_t i = 1; i < call.children.size(); ++i) {
        const auto* arg = call.Child(i);
        if (!arg || arg->kind == NodeKind::kKeyword || arg->kind == NodeKind::kStarred) {
            continue;
        }
        if (seen++ == index) {
            return arg;
        }
    }
    return nullptr;
}

std::optional<std::vector<std::string>> FoldSequence(const Node& node) {
    std::vector<std::string> items;
    if (node.kind == NodeKind::kList || node.kind == NodeKind::kTuple) {
        for (const auto& child : node.children) {
            if (!child) {
                return std::nullopt;
            }
            auto value = FoldString(*child);
            if (!value) {
                return std::nullopt;
            }
            items.push_back(*value);
        }
        return items;
    }
    // (f(x) for x in <literal list>) with f one of chr/str or the identity.
    if (node.kind == NodeKind::kComprehension && node.text != "dict" && node.children.size() == 3) {
        const auto* element = node.Child(0);
        const auto* target = node.Child(1);
        const auto* iter = node.Child(2);
        if (!element || !target || !iter || target->kind != NodeKind::kName ||
            (iter->kind != NodeKind::kList && iter->kind != NodeKind::kTuple)) {
            return std::nullopt;
        }
        const bool identity = element->IsName(target->text);
        const bool via_chr = element->kind == NodeKind::kCall && CalleeName(*element) == "chr" &&
                             element->Child(0)->kind == NodeKind::kName &&
                             PositionalArgument(*element, 0) &&
                             PositionalArgument(*element, 0)->IsName(target->text);
        if (!identity && !via_chr) {
            return std::nullopt;
        }
        for (const auto& child : iter->children) {
            if (!child) {
                return std::nullopt;
            }
            if (via_chr) {
                auto code = FoldInteger(*child);
                if (!code || *code < 0 || *code > 0x10FFFF) {
                    return std::nullopt;
                }
                std::string ch;
                AppendCodePoint(ch, *code);
                items.push_back(ch);
            } else {
                auto value = FoldString(*child);
                if (!value) {
                    return std::nullopt;
                }
                items.push_back(*value);
            }
        }
        return items;
    }
    auto text = FoldString(node);
    if (!text) {
        return std::nullopt;
    }
    for (char c : *text) {
        items.emplace_back(1, c);
    }
    return items;
}

std::optional<std::string> FoldSlice(const std::string& value, const Node& index) {
    const auto size = static_cast<long long>(value.size());
    if (index.kind != NodeKind::kSlice) {
        auto position = FoldInteger(index);
        if (!position) {
            return std::nullopt;
        }
        auto at = *position < 0 ? *position + size : *position;
        if (at < 0 || at >= size) {
            return std::nullopt;
        }
        return std::string(1, value[static_cast<std::size_t>(at)]);
    }
    long long step = 1;
    if (const auto* step_node = index.Child(2)) {
        auto folded = FoldInteger(*step_node);
        if (!folded || *folded == 0) {
            return std::nullopt;
        }
        step = *folded;
    }
    auto bound = [&](const Node* node, long long fallback) -> std::optional<long long> {
        if (!node) {
            return fallback;
        }
        auto folded = FoldInteger(*node);
        if (!folded) {
            return std::nullopt;
        }
        auto v = *folded;
        if (v < 0) {
            v += size;
        }
        if (step > 0) {
            return std::clamp(v, 0LL, size);
        }
        return std::clamp(v, -1LL, size - 1);
    };
    auto lower = bound(index.Child(0), step > 0 ? 0 : size - 1);
    auto upper = bound(index.Child(1), step > 0 ? size : -1);
    if (!lower || !upper) {
        return std::nullopt;
    }
    std::string out;
    if (step > 0) {
        for (auto i = *lower; i < *upper; i += step) {
            out.push_back(value[static_cast<std::size_t>(i)]);
        }
    } else {
        for (auto i = *lower; i > *upper; i += step) {
            out.push_back(value[static_cast<std::size_t>(i)]);
        }
    }
    return out;
}

std::optional<std::string> FoldCall(const Node& call) {
    const auto* func = call.Child(0);
    if (!func) {
        return std::nullopt;
    }
    const auto callee = CalleeName(call);
    const auto* first = PositionalArgument(call, 0);

    if (func->kind == NodeKind::kName) {
        if (callee == "chr" && first) {
            auto code = FoldInteger(*first);
            if (!code || *code < 0 || *code > 0x10FFFF) {
                return std::nullopt;
            }
            std::string out;
            AppendCodePoint(out, *code);
            return out;
        }
        if ((callee == "str" || callee == "list" || callee == "tuple") && first) {
            return FoldString(*first);
        }
        if (callee == "reversed" && first) {
            auto value = FoldString(*first);
            if (!value) {
                return std::nullopt;
            }
            return std::string(value->rbegin(), value->rend());
        }
        if ((callee == "bytes" || callee == "bytearray") && first) {
            if (first->kind == NodeKind::kList || first->kind == NodeKind::kTuple) {
                std::string out;
                for (const auto& child : first->children) {
                    auto code = child ? FoldInteger(*child) : std::nullopt;
                    if (!code || *code < 0 || *code > 255) {
                        return std::nullopt;
                    }
                    out.push_back(static_cast<char>(*code));
                }
                return out;
            }
            return FoldString(*first);
        }
    }

    if (IsCodecsDecode(call) && first) {
        auto data = FoldString(*first);
        const auto* codec_node = PositionalArgument(call, 1);
        std::string codec = "utf_8";
        if (codec_node) {
            auto folded = FoldString(*codec_node);
            if (!folded) {
                return std::nullopt;
            }
            codec = *folded;
        }
        if (!data) {
            return std::nullopt;
        }
        return ApplyCodec(*data, codec);
    }
    if (IsBase64Decoder(callee) && first) {
        auto data = FoldString(*first);
        if (!data) {
            return std::nullopt;
        }
        return DecodeBase64(*data, callee == "urlsafe_b64decode");
    }
    if (IsHexDecoder(callee) && first) {
        auto data = FoldString(*first);
        if (!data) {
            return std::nullopt;
        }
        return DecodeHex(*data);
    }

    if (func->kind != NodeKind::kAttribute || !func->Child(0)) {
        return std::nullopt;
    }
    auto receiver = FoldString(*func->Child(0));
    if (!receiver) {
        return std::nullopt;
    }
    if (callee == "join" && first) {
        auto items = FoldSequence(*first);
        if (!items) {
            return std::nullopt;
        }
        std::string out;
        for (std::size_t i = 0; i < items->size(); ++i) {
            if (i > 0) {
                out += *receiver;
            }
            out += (*items)[i];
            if (out.size() > kMaxFoldedLength) {
                return std::nullopt;
            }
        }
        return out;
    }
    if (callee == "decode" || callee == "encode") {
        if (first) {
            auto codec = FoldString(*first);
            if (!codec) {
                return std::nullopt;
            }
            return ApplyCodec(*receiver, *codec);
        }
        return receiver;
    }
    if (callee == "lower" || callee == "upper") {
        auto out = *receiver;
        std::transform(out.begin(), out.end(), out.begin(), [&](unsigned char c) {
            return static_cast<char>(callee == "lower" ? std::tolower(c) : std::toupper(c));
        });
        return out;
    }
    if (callee == "strip") {
        const auto begin = receiver->find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return std::string();
        }
        return receiver->substr(begin, receiver->find_last_not_of(" \t\r\n") - begin + 1);
    }
    if (callee == "replace" && first && PositionalArgument(call, 1)) {
        auto from = FoldString(*first);
        auto to = FoldString(*PositionalArgument(call, 1));
        if (!from || !to || from->empty()) {
            return std::nullopt;
        }
        std::string out = *receiver;
        std::size_t pos = 0;
        while ((pos = out.find(*from, pos)) != std::string::npos) {
            out.replace(pos, from->size(), *to);
            pos += to->size();
            if (out.size() > kMaxFoldedLength) {
                return std::nullopt;
            }
        }
        return out;
    }
    return std::nullopt;
}

}  // namespace

std::optional<long long> FoldInteger(const Node& node) {
    if (node.kind == NodeKind::kConstant && node.constant == ConstantKind::kNumber) {
        std::string digits;
        for (char c : node.value) {
            if (c != '_') {
                digits.push_back(c);
            }
        }
        int base = 10;
        std::size_t offset = 0;
        if (digits.size() > 2 && digits[0] == '0') {
            const char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
            if (marker == 'x') {
                base = 16;
            } else if (marker == 'o') {
                base = 8;
            } else if (marker == 'b') {
                base = 2;
            }
            if (base != 10) {
                offset = 2;
            }
        }
        const auto body = digits.substr(offset);
        if (body.empty()) {
            return std::nullopt;
        }
        errno = 0;
        char* end = nullptr;
        const long long value = std::strtoll(body.c_str(), &end, base);
        if (errno != 0 || end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return value;
    }
    if (node.kind == NodeKind::kUnaryOp && node.Child(0) && (node.text == "-" || node.text == "+")) {
        auto value = FoldInteger(*node.Child(0));
        if (!value) {
            return std::nullopt;
        }
        return node.text == "-" ? -*value : *value;
    }
    if (node.kind == NodeKind::kBinOp && node.Child(0) && node.Child(1)) {
        auto left = FoldInteger(*node.Child(0));
        auto right = FoldInteger(*node.Child(1));
        if (!left || !right || std::llabs(*left) > (1LL << 31) || std::llabs(*right) > (1LL << 31)) {
            return std::nullopt;
        }
        if (node.text == "+") {
            return *left + *right;
        }
        if (node.text == "-") {
            return *left - *right;
        }
        if (node.text == "*") {
            return *left * *right;
        }
        if (node.text == "//" && *right != 0) {
            return *left / *right;
        }
        if (node.text == "%" && *right != 0) {
            return *left % *right;
        }
        if (node.text == "^") {
            return *left ^ *right;
        }
        return std::nullopt;
    }
    if (node.kind == NodeKind::kCall && CalleeName(node) == "ord" &&
        node.Child(0)->kind == NodeKind::kName && PositionalArgument(node, 0)) {
        auto text = FoldString(*PositionalArgument(node, 0));
        if (!text || text->size() != 1) {
            return std::nullopt;
        }
        return static_cast<unsigned char>((*text)[0]);
    }
    return std::nullopt;
}

std::optional<std::string> FoldString(const Node& node) {
    switch (node.kind) {
        case NodeKind::kConstant:
            if (node.constant == ConstantKind::kString || node.constant == ConstantKind::kBytes) {
                return node.value;
            }
            return std::nullopt;
        case NodeKind::kJoinedStr: {
            std::string out;
            for (const auto& child : node.children) {
                auto part = child ? FoldString(*child) : std::nullopt;
                if (!part) {
                    return std::nullopt;
                }
                out += *part;
            }
            return Checked(out);
        }
        case NodeKind::kBinOp: {
            if (!node.Child(0) || !node.Child(1)) {
                return std::nullopt;
            }
            if (node.text == "+") {
                auto left = FoldString(*node.Child(0));
                auto right = FoldString(*node.Child(1));
                if (!left || !right) {
                    return std::nullopt;
                }
                return Checked(*left + *right);
            }
            if (node.text == "*") {
                auto text = FoldString(*node.Child(0));
                auto count = FoldInteger(*node.Child(1));
                if (!text) {
                    text = FoldString(*node.Child(1));
                    count = FoldInteger(*node.Child(0));
                }
                if (!text || !count) {
                    return std::nullopt;
                }
                if (text->empty() || *count <= 0) {
                    return std::string();
                }
                if (static_cast<unsigned long long>(*count) > kMaxFoldedLength / text->size()) {
                    return std::nullopt;
                }
                std::string out;
                for (long long i = 0; i < *count; ++i) {
                    out += *text;
                }
                return out;
            }
            return std::nullopt;
        }
        case NodeKind::kSubscript: {
            if (!node.Child(0) || !node.Child(1)) {
                return std::nullopt;
            }
            auto value = FoldString(*node.Child(0));
            if (!value) {
                return std::nullopt;
            }
            return FoldSlice(*value, *node.Child(1));
        }
        case NodeKind::kCall: {
            auto folded = FoldCall(node);
            if (!folded) {
                return std::nullopt;
            }
            return Checked(*folded);
        }
        default:
            return std::nullopt;
    }
}

bool IsDecodeCall(const Node& node) {
    if (node.kind != NodeKind::kCall) {
        return false;
    }
    const auto callee = CalleeName(node);
    return IsBase64Decoder(callee) || IsHexDecoder(callee) || IsCodecsDecode(node);
}

int CountCharacterCodes(const Node& node) {
    if (node.kind == NodeKind::kBinOp && node.text == "+") {
        int count = 0;
        for (const auto& child : node.children) {
            if (child) {
                count += CountCharacterCodes(*child);
            }
        }
        return count;
    }
    if (node.kind != NodeKind::kCall) {
        return 0;
    }
    const auto callee = CalleeName(node);
    const auto* first = PositionalArgument(node, 0);
    if (callee == "chr" && node.Child(0)->kind == NodeKind::kName) {
        return first && FoldInteger(*first) ? 1 : 0;
    }
    if (callee == "join" && first) {
        if (first->kind == NodeKind::kList || first->kind == NodeKind::kTuple) {
            int count = 0;
            for (const auto& child : first->children) {
                if (child) {
                    count += CountCharacterCodes(*child);
                }
            }
            return count;
        }
        if (first->kind == NodeKind::kComprehension && first->children.size() == 3) {
            const auto* element = first->Child(0);
            const auto* iter = first->Child(2);
            if (element && iter && element->kind == NodeKind::kCall &&
                CalleeName(*element) == "chr" &&
                (iter->kind == NodeKind::kList || iter->kind == NodeKind::kTuple)) {
                const bool literal_codes = std::all_of(
                    iter->children.begin(), iter->children.end(),
                    [](const NodePtr& child) { return child && FoldInteger(*child).has_value(); });
                return literal_codes ? static_cast<int>(iter->children.size()) : 0;
            }
        }
        return 0;
    }
    if (callee == "decode" && node.Child(0)->kind == NodeKind::kAttribute) {
        const auto* receiver = node.Child(0)->Child(0);
        if (receiver && receiver->kind == NodeKind::kCall) {
            const auto inner = CalleeName(*receiver);
            const auto* codes = PositionalArgument(*receiver, 0);
            if ((inner == "bytes" || inner == "bytearray") && codes &&
                (codes->kind == NodeKind::kList || codes->kind == NodeKind::kTuple) &&
                codes->children.size() >= 2 && FoldString(*receiver)) {
                return static_cast<int>(codes->children.size());
            }
        }
    }
    return 0;
}

std::string DescribeNode(const Node& node) {
    switch (node.kind) {
        case NodeKind::kName:
            return node.text;
        case NodeKind::kAttribute:
            return (node.Child(0) ? DescribeNode(*node.Child(0)) : std::string("?")) + "." + node.text;
        case NodeKind::kCall:
            return (node.Child(0) ? DescribeNode(*node.Child(0)) : std::string("?")) + "()";
        case NodeKind::kSubscript:
            return (node.Child(0) ? DescribeNode(*node.Child(0)) : std::string("?")) + "[...]";
        case NodeKind::kConstant:
            if (node.constant == ConstantKind::kString) {
                return "'" + node.value + "'";
            }
            return node.text;
        default:
            return "<expression>";
    }
}

std::string CalleeName(const Node& call) {
    const auto* func = call.Child(0);
    if (!func) {
        return {};
    }
    if (func->kind == NodeKind::kName || func->kind == NodeKind::kAttribute) {
        return func->text;
    }
    return {};
}

}  // namespace sandcell::safety
