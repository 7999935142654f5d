#pragma once

#include <slip/command.h>
#include <slip/result.hpp>

#include <string>
#include <variant>
#include <vector>

namespace YAML { class Node; }

namespace slip {

//=============================================================================
// Design document elements
//
// A design document is a flat, ordered list of elements. Order is both paint
// order and the channel through which alignment propagates; no element nests
// another.
//=============================================================================

enum class ElementType : uint8_t {
    Text,
    Align,
    FeedLine,
    Barcode,
    QrCode,
    Divider,
    Dynamic,
    ItemsList,
    SplitPayments,
    CutPaper,
    Unknown
};

struct TextElement {
    std::string content;   // may contain {{FIELD}} placeholders
    TextStyle style;
};

struct AlignElement {
    Alignment alignment = Alignment::Left;
};

struct FeedLineElement {
    int lines = 1;
};

struct BarcodeElement {
    std::string data;      // printed raw, never substituted
    BarcodeType barcodeType = BarcodeType::Code128;
};

struct QrCodeElement {
    std::string data;      // may contain {{FIELD}} placeholders
    int size = 3;
};

struct DividerElement {
    static constexpr const char* DEFAULT_CONTENT = "================================";
    std::string content = DEFAULT_CONTENT;
};

struct DynamicElement {
    std::string field;
};

struct ItemsListElement {
    std::string itemTemplate;
    bool showSku = false;
    bool showCategory = false;
    bool showModifiers = false;
    bool showUnitPrice = false;
};

struct SplitPaymentsElement {};

struct CutPaperElement {};

// Any record whose `type` is not recognized; renders nothing
struct UnknownElement {
    std::string type;
};

using Element = std::variant<
    TextElement,
    AlignElement,
    FeedLineElement,
    BarcodeElement,
    QrCodeElement,
    DividerElement,
    DynamicElement,
    ItemsListElement,
    SplitPaymentsElement,
    CutPaperElement,
    UnknownElement>;

using Document = std::vector<Element>;

ElementType elementType(const Element& element);

// Wire name of the element kind ("text", "feedLine", "items_list", ...)
const char* elementTypeName(ElementType type);

/**
 * Decode one element record (a map with a `type` key).
 *
 * Missing optional fields take their defaults. Fails when the record is not a
 * map, has no string `type`, or names an unknown barcode symbology.
 */
Result<Element> decodeElement(const YAML::Node& node);

/**
 * Decode a design document: either a sequence of element records or a map
 * holding that sequence under `elements`.
 */
Result<Document> decodeDocument(const YAML::Node& node);

} // namespace slip
