#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace YAML { class Node; }

namespace slip {

enum class Alignment : uint8_t {
    Left,
    Center,
    Right
};

enum class TextSize : uint8_t {
    Small,
    Normal,
    Large,
    XLarge
};

// Epson-compatible symbologies
enum class BarcodeType : uint8_t {
    UpcA,
    UpcE,
    Ean13,
    Jan13,
    Ean8,
    Jan8,
    Code39,
    Itf,
    Codabar,
    Code93,
    Code128,
    Gs1_128,
    Gs1DataBarOmnidirectional,
    Gs1DataBarTruncated,
    Gs1DataBarLimited,
    Gs1DataBarExpanded
};

struct TextStyle {
    bool bold = false;
    bool underline = false;
    TextSize size = TextSize::Normal;

    bool operator==(const TextStyle&) const = default;
};

/**
 * One printer-agnostic drawing command.
 *
 * Only the fields relevant to `type` are meaningful:
 *   SetAlignment -> alignment
 *   Feed         -> lines
 *   Text         -> text, style
 *   Barcode      -> text (data), barcodeType
 *   QrCode       -> text (data), qrSize
 *   Cut          -> (none)
 */
struct Command {
    enum class Type : uint8_t {
        SetAlignment,
        Feed,
        Text,
        Barcode,
        QrCode,
        Cut
    };

    Type type = Type::Text;
    Alignment alignment = Alignment::Left;
    int lines = 0;
    std::string text;
    TextStyle style;
    BarcodeType barcodeType = BarcodeType::Code128;
    int qrSize = 0;

    static Command setAlignment(Alignment alignment);
    static Command feed(int lines);
    static Command textLine(std::string text, TextStyle style = {});
    static Command barcode(std::string data, BarcodeType type);
    static Command qrCode(std::string data, int size);
    static Command cut();

    bool operator==(const Command&) const = default;
};

using CommandList = std::vector<Command>;

const char* alignmentName(Alignment alignment);
const char* textSizeName(TextSize size);
const char* barcodeTypeName(BarcodeType type);

// Name lookups are exact and case-sensitive ("CENTER", "XLARGE", "CODE128")
std::optional<Alignment> parseAlignment(std::string_view name);
std::optional<TextSize> parseTextSize(std::string_view name);
std::optional<BarcodeType> parseBarcodeType(std::string_view name);

/**
 * One-line debug form, e.g. `Text("Total", bold)` or `Feed(2)`.
 */
std::string toString(const Command& command);

/**
 * Encode the command list as a sequence of maps for the printer driver:
 *   - {op: text, text: "Hi", bold: true, size: LARGE}
 *   - {op: align, alignment: CENTER}
 */
YAML::Node encodeCommands(const CommandList& commands);

} // namespace slip
