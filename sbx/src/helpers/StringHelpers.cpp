#include "helpers/HelperArguments.h"
#include "helpers/HelperLibrary.h"
#include <algorithm>
#include <cctype>

namespace SBX {

using namespace HelperArguments;

namespace {

// Byte length of the UTF-8 sequence starting with lead
size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    } else if ((lead >> 5) == 0x6) {
        return 2;
    } else if ((lead >> 4) == 0xE) {
        return 3;
    } else if ((lead >> 3) == 0x1E) {
        return 4;
    }
    return 1;
}

std::vector<std::string> splitCodePoints(const std::string &text) {
    std::vector<std::string> points;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = std::min(utf8SequenceLength(static_cast<unsigned char>(text[pos])), text.size() - pos);
        points.push_back(text.substr(pos, length));
        pos += length;
    }
    return points;
}

std::string toUpperAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

HostValue upper(const HelperArgs &args) {
    if (isMissing(args, 0)) {
        return "";
    }
    return toUpperAscii(requireString(args, 0, "string.upper"));
}

HostValue lower(const HelperArgs &args) {
    return toLowerAscii(requireString(args, 0, "string.lower"));
}

HostValue trim(const HelperArgs &args) {
    const std::string &text = requireString(args, 0, "string.trim");
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(static_cast<unsigned char>(text[begin]))) {
        begin++;
    }
    while (end > begin && isSpace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return text.substr(begin, end - begin);
}

HostValue replace(const HelperArgs &args) {
    const std::string &text = requireString(args, 0, "string.replace");
    const std::string &search = requireString(args, 1, "string.replace");
    std::string replacement = isMissing(args, 2) ? std::string("undefined") : toDisplayString(at(args, 2));

    std::string result;
    if (search.empty()) {
        // replaceAll("") inserts between every character and at both ends
        result = replacement;
        for (const auto &point : splitCodePoints(text)) {
            result += point;
            result += replacement;
        }
        return result;
    }

    size_t pos = 0;
    size_t match;
    while ((match = text.find(search, pos)) != std::string::npos) {
        result.append(text, pos, match - pos);
        result += replacement;
        pos = match + search.size();
    }
    result.append(text, pos, std::string::npos);
    return result;
}

HostValue split(const HelperArgs &args) {
    const std::string &text = requireString(args, 0, "string.split");
    HostValue parts = HostValue::array();
    if (isMissing(args, 1)) {
        parts.push_back(text);
        return parts;
    }

    const std::string &separator = requireString(args, 1, "string.split");
    if (separator.empty()) {
        for (auto &point : splitCodePoints(text)) {
            parts.push_back(std::move(point));
        }
        return parts;
    }

    size_t pos = 0;
    size_t match;
    while ((match = text.find(separator, pos)) != std::string::npos) {
        parts.push_back(text.substr(pos, match - pos));
        pos = match + separator.size();
    }
    parts.push_back(text.substr(pos));
    return parts;
}

HostValue join(const HelperArgs &args) {
    const HostValue &items = requireArray(args, 0, "string.join");
    std::string separator = isMissing(args, 1) ? std::string(",") : toDisplayString(at(args, 1));

    std::string result;
    bool first = true;
    for (const auto &item : items) {
        if (!first) {
            result += separator;
        }
        first = false;
        if (!item.is_null()) {
            result += toDisplayString(item);
        }
    }
    return result;
}

HostValue slug(const HelperArgs &args) {
    std::string text = toLowerAscii(requireString(args, 0, "string.slug"));

    // Whitespace runs become a single dash, then anything outside [a-z0-9-] is dropped
    std::string dashed;
    bool inSpace = false;
    for (unsigned char c : text) {
        if (isSpace(c)) {
            if (!inSpace) {
                dashed += '-';
            }
            inSpace = true;
            continue;
        }
        inSpace = false;
        dashed += static_cast<char>(c);
    }

    std::string result;
    for (char c : dashed) {
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-') {
            result += c;
        }
    }
    return result;
}

HostValue capitalize(const HelperArgs &args) {
    const std::string &text = requireString(args, 0, "string.capitalize");
    if (text.empty()) {
        return text;
    }
    std::string result = toLowerAscii(text);
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    return result;
}

HostValue truncate(const HelperArgs &args) {
    const std::string &text = requireString(args, 0, "string.truncate");
    int64_t length = requireInteger(args, 1, "string.truncate");
    if (length < 0) {
        length = 0;
    }

    std::vector<std::string> points = splitCodePoints(text);
    if (points.size() <= static_cast<size_t>(length)) {
        return text;
    }

    std::string result;
    for (int64_t i = 0; i < length; ++i) {
        result += points[static_cast<size_t>(i)];
    }
    return result + "...";
}

}  // namespace

void registerStringHelpers(std::vector<HelperDescriptor> &out) {
    out.push_back({HelperNamespace::String, "upper", 1, upper});
    out.push_back({HelperNamespace::String, "lower", 1, lower});
    out.push_back({HelperNamespace::String, "trim", 1, trim});
    out.push_back({HelperNamespace::String, "replace", 3, replace});
    out.push_back({HelperNamespace::String, "split", 2, split});
    out.push_back({HelperNamespace::String, "join", 2, join});
    out.push_back({HelperNamespace::String, "slug", 1, slug});
    out.push_back({HelperNamespace::String, "capitalize", 1, capitalize});
    out.push_back({HelperNamespace::String, "truncate", 2, truncate});
}

}  // namespace SBX
