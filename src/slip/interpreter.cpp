#include <slip/interpreter.h>
#include <slip/item-list-renderer.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <variant>

namespace slip {

//=============================================================================
// Entry points
//=============================================================================

CommandList Interpreter::render(const Document& doc, const Order* order) const {
    Pass pass;
    pass.order = order;
    try {
        for (const auto& element : doc) {
            renderElement(element, pass);
        }
    } catch (const std::exception& e) {
        spdlog::error("Interpreter: render failed, printing error receipt: {}", e.what());
        return errorReceipt();
    }
    return pass.out.take();
}

CommandList Interpreter::render(const YAML::Node& design, const Order* order) const {
    Pass pass;
    pass.order = order;
    try {
        const YAML::Node elements = (design && design.IsMap()) ? design["elements"] : design;
        if (!elements || !elements.IsSequence()) {
            spdlog::error("Interpreter: design document has no element list");
            return errorReceipt();
        }
        for (std::size_t i = 0; i < elements.size(); ++i) {
            auto element = decodeElement(elements[i]);
            if (!element) {
                spdlog::error("Interpreter: element {}: {}", i, error_msg(element));
                return errorReceipt();
            }
            spdlog::trace("Interpreter: element {} is {}", i, elementTypeName(elementType(*element)));
            renderElement(*element, pass);
        }
    } catch (const std::exception& e) {
        spdlog::error("Interpreter: render failed, printing error receipt: {}", e.what());
        return errorReceipt();
    }
    return pass.out.take();
}

CommandList Interpreter::errorReceipt() const {
    CommandBuilder out;
    out.text(_options.errorText, TextStyle{true, false, TextSize::Normal});
    out.feed(1);
    out.cut();
    return out.take();
}

CommandList render(const Document& doc, const Order* order) {
    return Interpreter().render(doc, order);
}

//=============================================================================
// Element dispatch
//=============================================================================

void Interpreter::renderElement(const Element& element, Pass& pass) const {
    pass.ambient.apply(element);
    std::visit([&](const auto& el) { emit(el, pass); }, element);
}

void Interpreter::emit(const TextElement& el, Pass& pass) const {
    pass.out.ensureAlignment(pass.ambient.currentAlignment());
    pass.out.text(substitutePlaceholders(el.content, pass.order, _options.resolver), el.style);
}

void Interpreter::emit(const AlignElement& el, Pass& pass) const {
    pass.out.align(el.alignment);
}

void Interpreter::emit(const FeedLineElement& el, Pass& pass) const {
    pass.out.feed(el.lines);
}

void Interpreter::emit(const BarcodeElement& el, Pass& pass) const {
    // Raw data: barcodes carry identifiers, not templates
    pass.out.ensureAlignment(pass.ambient.currentAlignment());
    pass.out.barcode(el.data, el.barcodeType);
}

void Interpreter::emit(const QrCodeElement& el, Pass& pass) const {
    pass.out.ensureAlignment(pass.ambient.currentAlignment());
    pass.out.qrCode(substitutePlaceholders(el.data, pass.order, _options.resolver), el.size);
}

void Interpreter::emit(const DividerElement& el, Pass& pass) const {
    pass.out.ensureAlignment(Alignment::Center);
    pass.out.text(el.content);
}

void Interpreter::emit(const DynamicElement& el, Pass& pass) const {
    pass.out.ensureAlignment(pass.ambient.currentAlignment());
    pass.out.text(resolveField(el.field, pass.order, _options.resolver));
}

void Interpreter::emit(const ItemsListElement& el, Pass& pass) const {
    if (!pass.order) {
        spdlog::debug("Interpreter: items_list skipped, no order");
        return;
    }
    ItemListRenderer(pass.out, _options.resolver).render(el, *pass.order);
}

void Interpreter::emit(const SplitPaymentsElement&, Pass&) const {
    // Layout for split payments is not defined yet
}

void Interpreter::emit(const CutPaperElement&, Pass& pass) const {
    pass.out.cut();
}

void Interpreter::emit(const UnknownElement& el, Pass&) const {
    spdlog::warn("Interpreter: unknown element type '{}' ignored", el.type);
}

} // namespace slip
