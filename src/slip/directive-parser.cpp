#include <slip/directive-parser.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <utility>

namespace slip {

namespace {

constexpr std::array<std::pair<std::string_view, Alignment>, 3> ALIGN_DIRECTIVES = {{
    {"{{align:left}}", Alignment::Left},
    {"{{align:center}}", Alignment::Center},
    {"{{align:right}}", Alignment::Right},
}};

constexpr std::string_view FEED_PREFIX = "{{feedLine:";
constexpr std::string_view FEED_BARE = "{{feedLine}}";
constexpr std::string_view CLOSE = "}}";

// Every control character and the space count as blank
bool isTrimmed(char c) {
    return static_cast<unsigned char>(c) <= ' ';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

//=============================================================================
// LineInstruction
//=============================================================================

LineInstruction LineInstruction::setAlignment(Alignment alignment) {
    LineInstruction ins;
    ins.type = Type::SetAlignment;
    ins.alignment = alignment;
    return ins;
}

LineInstruction LineInstruction::feed(int lines) {
    LineInstruction ins;
    ins.type = Type::Feed;
    ins.lines = lines;
    return ins;
}

LineInstruction LineInstruction::textLine(std::string text) {
    LineInstruction ins;
    ins.type = Type::Text;
    ins.text = std::move(text);
    return ins;
}

//=============================================================================
// DirectiveParser
//=============================================================================

std::string_view DirectiveParser::trim(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && isTrimmed(s[start])) ++start;
    while (end > start && isTrimmed(s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::vector<std::string_view> DirectiveParser::splitLines(std::string_view tmpl) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '\n') {
            lines.push_back(tmpl.substr(start, i - start));
            start = ++i;
        } else if (tmpl[i] == '\\' && i + 1 < tmpl.size() && tmpl[i + 1] == 'n') {
            lines.push_back(tmpl.substr(start, i - start));
            i += 2;
            start = i;
        } else {
            ++i;
        }
    }
    lines.push_back(tmpl.substr(start));
    return lines;
}

std::vector<LineInstruction> DirectiveParser::parseLine(std::string_view line) {
    _warnings.clear();
    std::vector<LineInstruction> out;
    parseInto(line, out);
    return out;
}

std::vector<LineInstruction> DirectiveParser::parseTemplate(std::string_view tmpl) {
    _warnings.clear();
    std::vector<LineInstruction> out;
    for (auto line : splitLines(tmpl)) {
        parseInto(line, out);
    }
    return out;
}

void DirectiveParser::parseInto(std::string_view rawLine, std::vector<LineInstruction>& out) {
    std::string_view line = trim(rawLine);
    if (line.empty()) return;

    // At most one leading directive per line
    bool matched = false;
    for (const auto& [token, alignment] : ALIGN_DIRECTIVES) {
        if (line.starts_with(token)) {
            out.push_back(LineInstruction::setAlignment(alignment));
            line.remove_prefix(token.size());
            matched = true;
            break;
        }
    }

    if (!matched && line.starts_with(FEED_PREFIX)) {
        size_t close = line.find(CLOSE, FEED_PREFIX.size());
        if (close != std::string_view::npos) {
            auto arg = line.substr(FEED_PREFIX.size(), close - FEED_PREFIX.size());
            out.push_back(LineInstruction::feed(parseFeedCount(arg)));
            line.remove_prefix(close + CLOSE.size());
            matched = true;
        }
    }

    if (!matched && line.starts_with(FEED_BARE)) {
        out.push_back(LineInstruction::feed(1));
        line.remove_prefix(FEED_BARE.size());
    }

    if (!line.empty()) {
        out.push_back(LineInstruction::textLine(std::string(line)));
    }
}

int DirectiveParser::parseFeedCount(std::string_view arg) {
    // Longest run of digits inside the argument
    size_t bestStart = 0;
    size_t bestLen = 0;
    for (size_t i = 0; i < arg.size();) {
        if (!isDigit(arg[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < arg.size() && isDigit(arg[i])) ++i;
        if (i - start > bestLen) {
            bestStart = start;
            bestLen = i - start;
        }
    }

    int count = 0;
    if (bestLen > 0) {
        const char* first = arg.data() + bestStart;
        auto [ptr, ec] = std::from_chars(first, first + bestLen, count);
        if (ec == std::errc() && count >= 0) {
            return count;
        }
    }

    std::string warning = "feedLine count '" + std::string(arg) + "' has no usable number, using 1";
    spdlog::debug("DirectiveParser: {}", warning);
    _warnings.push_back(std::move(warning));
    return 1;
}

} // namespace slip
