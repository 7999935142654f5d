#pragma once

#include <slip/command.h>

#include <string>
#include <string_view>
#include <vector>

namespace slip {

/**
 * Instruction produced for one item-template line.
 */
struct LineInstruction {
    enum class Type : uint8_t {
        SetAlignment,   // alignment
        Feed,           // lines
        Text            // text
    };

    Type type = Type::Text;
    Alignment alignment = Alignment::Left;
    int lines = 0;
    std::string text;

    static LineInstruction setAlignment(Alignment alignment);
    static LineInstruction feed(int lines);
    static LineInstruction textLine(std::string text);

    bool operator==(const LineInstruction&) const = default;
};

/**
 * DirectiveParser - parses item-template lines that mix literal text with
 * inline directives.
 *
 * Directives (recognized only as the line's leading token, one per line):
 *   {{align:left}}  {{align:center}}  {{align:right}}
 *   {{feedLine}}                      -> Feed(1)
 *   {{feedLine:N}}                    -> Feed(N), N >= 0; unparseable N -> Feed(1)
 *
 * Whatever follows the directive is emitted verbatim as Text. A second
 * directive on the same line is literal text.
 *
 * Example:
 *   "{{align:right}}$12.50"  ->  [SetAlignment(RIGHT), Text("$12.50")]
 */
class DirectiveParser {
public:
    DirectiveParser() = default;

    /**
     * Parse one template line. The line is trimmed first; an empty line
     * yields no instructions.
     */
    std::vector<LineInstruction> parseLine(std::string_view line);

    /**
     * Split a template on newlines or the two-character escape `\n` and parse
     * each line in order.
     */
    std::vector<LineInstruction> parseTemplate(std::string_view tmpl);

    /**
     * Warnings about malformed directives seen since the last parse call.
     */
    const std::vector<std::string>& warnings() const { return _warnings; }

    static std::vector<std::string_view> splitLines(std::string_view tmpl);
    static std::string_view trim(std::string_view s);

private:
    void parseInto(std::string_view line, std::vector<LineInstruction>& out);
    int parseFeedCount(std::string_view arg);

    std::vector<std::string> _warnings;
};

} // namespace slip
