#include <slip/element.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace slip {

namespace {

// Scalar lookup with a default; absent or unconvertible values fall back
template<typename T>
T field(const YAML::Node& node, const char* key, const T& defaultValue) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) return defaultValue;
    return value.as<T>(defaultValue);
}

TextStyle decodeStyle(const YAML::Node& node) {
    TextStyle style;
    if (!node || !node.IsMap()) return style;

    style.bold = field<bool>(node, "bold", false);
    style.underline = field<bool>(node, "underline", false);

    auto sizeName = field<std::string>(node, "size", "NORMAL");
    if (auto size = parseTextSize(sizeName)) {
        style.size = *size;
    } else {
        spdlog::debug("text style: unknown size '{}', using NORMAL", sizeName);
    }
    return style;
}

} // namespace

ElementType elementType(const Element& element) {
    return static_cast<ElementType>(element.index());
}

const char* elementTypeName(ElementType type) {
    switch (type) {
        case ElementType::Text:          return "text";
        case ElementType::Align:         return "align";
        case ElementType::FeedLine:      return "feedLine";
        case ElementType::Barcode:       return "barcode";
        case ElementType::QrCode:        return "qrcode";
        case ElementType::Divider:       return "divider";
        case ElementType::Dynamic:       return "dynamic";
        case ElementType::ItemsList:     return "items_list";
        case ElementType::SplitPayments: return "split_payments";
        case ElementType::CutPaper:      return "cutPaper";
        case ElementType::Unknown:       return "unknown";
    }
    return "unknown";
}

Result<Element> decodeElement(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return Err<Element>("element record is not a map");
    }
    const YAML::Node typeNode = node["type"];
    if (!typeNode || !typeNode.IsScalar()) {
        return Err<Element>("element record has no type");
    }
    const std::string type = typeNode.as<std::string>();

    if (type == "text") {
        TextElement el;
        el.content = field<std::string>(node, "content", "");
        el.style = decodeStyle(node["style"]);
        return Ok(Element(std::move(el)));
    }

    if (type == "align") {
        AlignElement el;
        auto name = field<std::string>(node, "alignment", "LEFT");
        el.alignment = parseAlignment(name).value_or(Alignment::Left);
        return Ok(Element(el));
    }

    if (type == "feedLine") {
        FeedLineElement el;
        el.lines = field<int>(node, "lines", 1);
        if (el.lines < 1) {
            spdlog::debug("feedLine: lines={} raised to 1", el.lines);
            el.lines = 1;
        }
        return Ok(Element(el));
    }

    if (type == "barcode") {
        BarcodeElement el;
        el.data = field<std::string>(node, "data", "");
        auto name = field<std::string>(node, "barcodeType", "CODE128");
        auto barcodeType = parseBarcodeType(name);
        if (!barcodeType) {
            return Err<Element>("barcode: unknown barcodeType '" + name + "'");
        }
        el.barcodeType = *barcodeType;
        return Ok(Element(std::move(el)));
    }

    if (type == "qrcode") {
        QrCodeElement el;
        el.data = field<std::string>(node, "data", "");
        el.size = node["qrSize"] ? field<int>(node, "qrSize", 3)
                                 : field<int>(node, "size", 3);
        return Ok(Element(std::move(el)));
    }

    if (type == "divider") {
        DividerElement el;
        el.content = field<std::string>(node, "content", DividerElement::DEFAULT_CONTENT);
        return Ok(Element(std::move(el)));
    }

    if (type == "dynamic") {
        DynamicElement el;
        el.field = field<std::string>(node, "field", "");
        return Ok(Element(std::move(el)));
    }

    if (type == "items_list") {
        ItemsListElement el;
        el.itemTemplate = field<std::string>(node, "itemTemplate", "");
        el.showSku = field<bool>(node, "showSku", false);
        el.showCategory = field<bool>(node, "showCategory", false);
        el.showModifiers = field<bool>(node, "showModifiers", false);
        el.showUnitPrice = field<bool>(node, "showUnitPrice", false);
        return Ok(Element(std::move(el)));
    }

    if (type == "split_payments") {
        return Ok(Element(SplitPaymentsElement{}));
    }

    if (type == "cutPaper") {
        return Ok(Element(CutPaperElement{}));
    }

    return Ok(Element(UnknownElement{type}));
}

Result<Document> decodeDocument(const YAML::Node& node) {
    // Copy-construct only: assigning to a YAML::Node rebinds the shared node
    const YAML::Node elements = (node && node.IsMap()) ? node["elements"] : node;
    if (!elements || !elements.IsSequence()) {
        return Err<Document>("design document has no element list");
    }

    Document doc;
    doc.reserve(elements.size());
    for (std::size_t i = 0; i < elements.size(); ++i) {
        auto res = decodeElement(elements[i]);
        if (!res) {
            return Err<Document>("element " + std::to_string(i), res);
        }
        doc.push_back(std::move(*res));
    }
    return Ok(std::move(doc));
}

} // namespace slip
