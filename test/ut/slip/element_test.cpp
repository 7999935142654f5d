//=============================================================================
// Element Decoding Tests
//
// Design records (JSON/YAML maps) into the Element variant
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <slip/element.h>
#include <yaml-cpp/yaml.h>

using namespace boost::ut;
using namespace slip;

namespace {

Result<Element> decode(const char* json) {
    return decodeElement(YAML::Load(json));
}

} // namespace

suite element_decode_tests = [] {
    "text with style"_test = [] {
        auto res = decode(R"({"type": "text", "content": "Hi {{STORE_NAME}}",
                              "style": {"bold": true, "underline": true, "size": "XLARGE"}})");
        expect(res.has_value() >> fatal) << error_msg(res);

        const auto* el = std::get_if<TextElement>(&*res);
        expect((el != nullptr) >> fatal);
        expect(eq(el->content, std::string("Hi {{STORE_NAME}}")));
        expect(el->style.bold);
        expect(el->style.underline);
        expect(el->style.size == TextSize::XLarge);
    };

    "text without style is plain"_test = [] {
        auto res = decode(R"({"type": "text", "content": "x"})");
        expect(res.has_value() >> fatal);
        expect(std::get<TextElement>(*res).style == TextStyle{});
    };

    "unknown text size falls back to normal"_test = [] {
        auto res = decode(R"({"type": "text", "content": "x", "style": {"size": "HUGE"}})");
        expect(res.has_value() >> fatal);
        expect(std::get<TextElement>(*res).style.size == TextSize::Normal);
    };

    "align"_test = [] {
        auto res = decode(R"({"type": "align", "alignment": "RIGHT"})");
        expect(res.has_value() >> fatal);
        expect(std::get<AlignElement>(*res).alignment == Alignment::Right);
    };

    "feedLine defaults and clamps"_test = [] {
        auto plain = decode(R"({"type": "feedLine"})");
        expect(plain.has_value() >> fatal);
        expect(std::get<FeedLineElement>(*plain).lines == 1_i);

        auto three = decode(R"({"type": "feedLine", "lines": 3})");
        expect(three.has_value() >> fatal);
        expect(std::get<FeedLineElement>(*three).lines == 3_i);

        auto zero = decode(R"({"type": "feedLine", "lines": 0})");
        expect(zero.has_value() >> fatal);
        expect(std::get<FeedLineElement>(*zero).lines == 1_i);
    };

    "barcode"_test = [] {
        auto res = decode(R"({"type": "barcode", "data": "4006381333931", "barcodeType": "EAN13"})");
        expect(res.has_value() >> fatal);
        const auto& el = std::get<BarcodeElement>(*res);
        expect(eq(el.data, std::string("4006381333931")));
        expect(el.barcodeType == BarcodeType::Ean13);
    };

    "barcode type defaults to code128"_test = [] {
        auto res = decode(R"({"type": "barcode", "data": "X"})");
        expect(res.has_value() >> fatal);
        expect(std::get<BarcodeElement>(*res).barcodeType == BarcodeType::Code128);
    };

    "unknown barcode type is an error"_test = [] {
        auto res = decode(R"({"type": "barcode", "data": "X", "barcodeType": "code128"})");
        expect(!res.has_value());
        expect(error_msg(res).find("code128") != std::string::npos);
    };

    "qrcode size and alias"_test = [] {
        auto sized = decode(R"({"type": "qrcode", "data": "d", "qrSize": 8})");
        expect(sized.has_value() >> fatal);
        expect(std::get<QrCodeElement>(*sized).size == 8_i);

        auto alias = decode(R"({"type": "qrcode", "data": "d", "size": 5})");
        expect(alias.has_value() >> fatal);
        expect(std::get<QrCodeElement>(*alias).size == 5_i);

        auto plain = decode(R"({"type": "qrcode", "data": "d"})");
        expect(plain.has_value() >> fatal);
        expect(std::get<QrCodeElement>(*plain).size == 3_i);
    };

    "divider default content"_test = [] {
        auto res = decode(R"({"type": "divider"})");
        expect(res.has_value() >> fatal);
        expect(eq(std::get<DividerElement>(*res).content, std::string(32, '=')));
    };

    "items list flags"_test = [] {
        auto res = decode(R"({"type": "items_list", "itemTemplate": "{{name}}",
                              "showSku": true, "showUnitPrice": true})");
        expect(res.has_value() >> fatal);
        const auto& el = std::get<ItemsListElement>(*res);
        expect(eq(el.itemTemplate, std::string("{{name}}")));
        expect(el.showSku);
        expect(!el.showCategory);
        expect(!el.showModifiers);
        expect(el.showUnitPrice);
    };

    "kinds without fields"_test = [] {
        auto split = decode(R"({"type": "split_payments"})");
        auto cut = decode(R"({"type": "cutPaper"})");
        expect((split.has_value() && cut.has_value()) >> fatal);
        expect(elementType(*split) == ElementType::SplitPayments);
        expect(elementType(*cut) == ElementType::CutPaper);
    };

    "unrecognized type decodes as unknown"_test = [] {
        auto res = decode(R"({"type": "logo", "src": "a.png"})");
        expect(res.has_value() >> fatal);
        expect(elementType(*res) == ElementType::Unknown);
        expect(eq(std::get<UnknownElement>(*res).type, std::string("logo")));
    };

    "record must be a map with a type"_test = [] {
        expect(!decode(R"(["text"])").has_value());
        expect(!decode(R"({"content": "x"})").has_value());
        expect(!decode(R"({"type": {"nested": true}})").has_value());
    };
};

suite element_document_tests = [] {
    "bare sequence"_test = [] {
        auto res = decodeDocument(YAML::Load(R"([{"type": "text"}, {"type": "cutPaper"}])"));
        expect(res.has_value() >> fatal);
        expect(res->size() == 2_u);
    };

    "map with elements"_test = [] {
        YAML::Node design = YAML::Load(R"({"name": "default", "elements": [{"type": "divider"}]})");
        auto res = decodeDocument(design);
        expect(res.has_value() >> fatal);
        expect(res->size() == 1_u);
        expect(elementType(res->front()) == ElementType::Divider);

        // Decoding leaves the input untouched
        expect(design["name"].as<std::string>() == std::string("default"));
        expect(design["elements"].IsSequence());
    };

    "failure names the element index"_test = [] {
        auto res = decodeDocument(YAML::Load(R"([{"type": "text"}, {"type": "barcode", "barcodeType": "NOPE"}])"));
        expect(!res.has_value());
        expect(error_msg(res).find("element 1") == 0_u);
    };

    "missing element list"_test = [] {
        expect(!decodeDocument(YAML::Load(R"({"name": "x"})")).has_value());
    };
};

suite element_name_tests = [] {
    "wire names"_test = [] {
        expect(std::string(elementTypeName(ElementType::FeedLine)) == std::string("feedLine"));
        expect(std::string(elementTypeName(ElementType::ItemsList)) == std::string("items_list"));
        expect(std::string(elementTypeName(ElementType::QrCode)) == std::string("qrcode"));
        expect(std::string(elementTypeName(ElementType::CutPaper)) == std::string("cutPaper"));
    };

    "element type follows the variant"_test = [] {
        expect(elementType(Element{AlignElement{}}) == ElementType::Align);
        expect(elementType(Element{DynamicElement{"TOTAL"}}) == ElementType::Dynamic);
    };
};
