//=============================================================================
// Text Preview Tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <slip/text-preview.h>

using namespace boost::ut;
using namespace slip;

suite text_preview_tests = [] {
    "alignment pads each line"_test = [] {
        CommandList commands = {
            Command::setAlignment(Alignment::Center),
            Command::textLine("Acme"),
            Command::setAlignment(Alignment::Right),
            Command::textLine("$4.00"),
            Command::setAlignment(Alignment::Left),
            Command::textLine("Soda"),
        };
        expect(eq(renderTextPreview(commands, 20),
                  std::string("        Acme\n"
                              "               $4.00\n"
                              "Soda\n")));
    };

    "feed adds blank lines"_test = [] {
        CommandList commands = {Command::textLine("a"), Command::feed(2), Command::textLine("b")};
        expect(eq(renderTextPreview(commands, 20), std::string("a\n\n\nb\n")));
    };

    "long text wraps at the width"_test = [] {
        CommandList commands = {Command::textLine("abcdefghij")};
        expect(eq(renderTextPreview(commands, 8), std::string("abcdefgh\nij\n")));
    };

    "multibyte characters count as one column"_test = [] {
        // "Cafe" with e-acute, two bytes in UTF-8
        CommandList centered = {Command::setAlignment(Alignment::Center), Command::textLine("Caf\xC3\xA9")};
        expect(eq(renderTextPreview(centered, 8), std::string("  Caf\xC3\xA9\n")));

        expect(eq(renderTextPreview({Command::textLine("Abcdefg\xC3\xA9")}, 8),
                  std::string("Abcdefg\xC3\xA9\n")));
        expect(eq(renderTextPreview({Command::textLine("Abcdefgh\xC3\xA9")}, 8),
                  std::string("Abcdefgh\n\xC3\xA9\n")));
    };

    "width below eight is raised"_test = [] {
        CommandList commands = {Command::textLine("abcdefghij")};
        expect(eq(renderTextPreview(commands, 3), renderTextPreview(commands, 8)));
    };

    "empty text still takes a line"_test = [] {
        expect(eq(renderTextPreview({Command::textLine("")}, 20), std::string("\n")));
    };

    "barcode and qr markers"_test = [] {
        CommandList commands = {
            Command::barcode("123", BarcodeType::Code128),
            Command::qrCode("url", 3),
        };
        expect(eq(renderTextPreview(commands, 20), std::string("[CODE128 123]\n[QR x3 url]\n")));
    };

    "cut is a dashed line"_test = [] {
        expect(eq(renderTextPreview({Command::cut()}, 20), std::string("------- CUT --------\n")));
    };

    "styles do not change the layout"_test = [] {
        TextStyle style;
        style.bold = true;
        style.size = TextSize::XLarge;
        expect(eq(renderTextPreview({Command::textLine("Hi", style)}, 20),
                  renderTextPreview({Command::textLine("Hi")}, 20)));
    };
};
