#include <slip/command.h>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include <array>
#include <utility>

namespace slip {

namespace {

constexpr std::array<std::pair<BarcodeType, const char*>, 16> BARCODE_NAMES = {{
    {BarcodeType::UpcA, "UPC_A"},
    {BarcodeType::UpcE, "UPC_E"},
    {BarcodeType::Ean13, "EAN13"},
    {BarcodeType::Jan13, "JAN13"},
    {BarcodeType::Ean8, "EAN8"},
    {BarcodeType::Jan8, "JAN8"},
    {BarcodeType::Code39, "CODE39"},
    {BarcodeType::Itf, "ITF"},
    {BarcodeType::Codabar, "CODABAR"},
    {BarcodeType::Code93, "CODE93"},
    {BarcodeType::Code128, "CODE128"},
    {BarcodeType::Gs1_128, "GS1_128"},
    {BarcodeType::Gs1DataBarOmnidirectional, "GS1_DATABAR_OMNIDIRECTIONAL"},
    {BarcodeType::Gs1DataBarTruncated, "GS1_DATABAR_TRUNCATED"},
    {BarcodeType::Gs1DataBarLimited, "GS1_DATABAR_LIMITED"},
    {BarcodeType::Gs1DataBarExpanded, "GS1_DATABAR_EXPANDED"},
}};

// Escape quotes and control characters for the debug form
std::string quoted(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

} // namespace

//=============================================================================
// Factories
//=============================================================================

Command Command::setAlignment(Alignment alignment) {
    Command cmd;
    cmd.type = Type::SetAlignment;
    cmd.alignment = alignment;
    return cmd;
}

Command Command::feed(int lines) {
    Command cmd;
    cmd.type = Type::Feed;
    cmd.lines = lines;
    return cmd;
}

Command Command::textLine(std::string text, TextStyle style) {
    Command cmd;
    cmd.type = Type::Text;
    cmd.text = std::move(text);
    cmd.style = style;
    return cmd;
}

Command Command::barcode(std::string data, BarcodeType type) {
    Command cmd;
    cmd.type = Type::Barcode;
    cmd.text = std::move(data);
    cmd.barcodeType = type;
    return cmd;
}

Command Command::qrCode(std::string data, int size) {
    Command cmd;
    cmd.type = Type::QrCode;
    cmd.text = std::move(data);
    cmd.qrSize = size;
    return cmd;
}

Command Command::cut() {
    Command cmd;
    cmd.type = Type::Cut;
    return cmd;
}

//=============================================================================
// Names
//=============================================================================

const char* alignmentName(Alignment alignment) {
    switch (alignment) {
        case Alignment::Left:   return "LEFT";
        case Alignment::Center: return "CENTER";
        case Alignment::Right:  return "RIGHT";
    }
    return "LEFT";
}

const char* textSizeName(TextSize size) {
    switch (size) {
        case TextSize::Small:  return "SMALL";
        case TextSize::Normal: return "NORMAL";
        case TextSize::Large:  return "LARGE";
        case TextSize::XLarge: return "XLARGE";
    }
    return "NORMAL";
}

const char* barcodeTypeName(BarcodeType type) {
    for (const auto& [value, name] : BARCODE_NAMES) {
        if (value == type) return name;
    }
    return "CODE128";
}

std::optional<Alignment> parseAlignment(std::string_view name) {
    if (name == "LEFT") return Alignment::Left;
    if (name == "CENTER") return Alignment::Center;
    if (name == "RIGHT") return Alignment::Right;
    return std::nullopt;
}

std::optional<TextSize> parseTextSize(std::string_view name) {
    if (name == "SMALL") return TextSize::Small;
    if (name == "NORMAL") return TextSize::Normal;
    if (name == "LARGE") return TextSize::Large;
    if (name == "XLARGE") return TextSize::XLarge;
    return std::nullopt;
}

std::optional<BarcodeType> parseBarcodeType(std::string_view name) {
    for (const auto& [value, label] : BARCODE_NAMES) {
        if (name == label) return value;
    }
    return std::nullopt;
}

//=============================================================================
// Debug form and encoding
//=============================================================================

std::string toString(const Command& command) {
    switch (command.type) {
        case Command::Type::SetAlignment:
            return fmt::format("SetAlignment({})", alignmentName(command.alignment));
        case Command::Type::Feed:
            return fmt::format("Feed({})", command.lines);
        case Command::Type::Text: {
            std::string out = "Text(" + quoted(command.text);
            if (command.style.bold) out += ", bold";
            if (command.style.underline) out += ", underline";
            if (command.style.size != TextSize::Normal) {
                out += ", ";
                out += textSizeName(command.style.size);
            }
            return out + ")";
        }
        case Command::Type::Barcode:
            return fmt::format("Barcode({}, {})", quoted(command.text),
                               barcodeTypeName(command.barcodeType));
        case Command::Type::QrCode:
            return fmt::format("QRCode({}, {})", quoted(command.text), command.qrSize);
        case Command::Type::Cut:
            return "Cut";
    }
    return "?";
}

YAML::Node encodeCommands(const CommandList& commands) {
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& cmd : commands) {
        YAML::Node node(YAML::NodeType::Map);
        switch (cmd.type) {
            case Command::Type::SetAlignment:
                node["op"] = "align";
                node["alignment"] = alignmentName(cmd.alignment);
                break;
            case Command::Type::Feed:
                node["op"] = "feed";
                node["lines"] = cmd.lines;
                break;
            case Command::Type::Text:
                node["op"] = "text";
                node["text"] = cmd.text;
                if (cmd.style.bold) node["bold"] = true;
                if (cmd.style.underline) node["underline"] = true;
                if (cmd.style.size != TextSize::Normal) {
                    node["size"] = textSizeName(cmd.style.size);
                }
                break;
            case Command::Type::Barcode:
                node["op"] = "barcode";
                node["data"] = cmd.text;
                node["barcodeType"] = barcodeTypeName(cmd.barcodeType);
                break;
            case Command::Type::QrCode:
                node["op"] = "qrcode";
                node["data"] = cmd.text;
                node["size"] = cmd.qrSize;
                break;
            case Command::Type::Cut:
                node["op"] = "cut";
                break;
        }
        seq.push_back(node);
    }
    return seq;
}

} // namespace slip
