#include <slip/text-preview.h>
#include <fmt/format.h>

#include <algorithm>

namespace slip {

namespace {

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

void appendAligned(std::string& out, const std::string& text, Alignment alignment, size_t width) {
    // Hard-wrap, then pad each chunk; an empty text still prints one line.
    // One column per UTF-8 code point, never split inside a sequence.
    size_t pos = 0;
    do {
        size_t end = pos;
        size_t columns = 0;
        while (end < text.size() && columns < width) {
            ++end;
            while (end < text.size() && isContinuationByte(static_cast<unsigned char>(text[end]))) {
                ++end;
            }
            ++columns;
        }
        std::string chunk = text.substr(pos, end - pos);
        pos = end;

        size_t pad = width > columns ? width - columns : 0;
        size_t left = 0;
        if (alignment == Alignment::Center) left = pad / 2;
        else if (alignment == Alignment::Right) left = pad;

        std::string line = std::string(left, ' ') + chunk;
        // Trailing blanks carry no information
        while (!line.empty() && line.back() == ' ') line.pop_back();
        out += line;
        out += '\n';
    } while (pos < text.size());
}

} // namespace

std::string renderTextPreview(const CommandList& commands, int width) {
    const size_t cols = static_cast<size_t>(std::max(width, 8));
    std::string out;
    Alignment alignment = Alignment::Left;

    for (const auto& cmd : commands) {
        switch (cmd.type) {
            case Command::Type::SetAlignment:
                alignment = cmd.alignment;
                break;
            case Command::Type::Feed:
                out.append(static_cast<size_t>(std::max(cmd.lines, 0)), '\n');
                break;
            case Command::Type::Text:
                appendAligned(out, cmd.text, alignment, cols);
                break;
            case Command::Type::Barcode:
                appendAligned(out, fmt::format("[{} {}]", barcodeTypeName(cmd.barcodeType), cmd.text),
                              alignment, cols);
                break;
            case Command::Type::QrCode:
                appendAligned(out, fmt::format("[QR x{} {}]", cmd.qrSize, cmd.text), alignment, cols);
                break;
            case Command::Type::Cut: {
                std::string label = " CUT ";
                size_t dashes = cols > label.size() ? cols - label.size() : 0;
                out += std::string(dashes / 2, '-') + label + std::string(dashes - dashes / 2, '-');
                out += '\n';
                break;
            }
        }
    }
    return out;
}

} // namespace slip
