#include <slip/item-list-renderer.h>
#include <slip/alignment-state.h>
#include <spdlog/spdlog.h>

namespace slip {

namespace {

constexpr TextStyle DETAIL_STYLE{false, false, TextSize::Small};
constexpr TextStyle HEADER_STYLE{true, false, TextSize::Normal};

std::string joinModifiers(const std::vector<std::string>& modifiers) {
    std::string out;
    for (size_t i = 0; i < modifiers.size(); ++i) {
        if (i > 0) out += ", ";
        out += modifiers[i];
    }
    return out;
}

} // namespace

std::string substituteItemFields(std::string_view tmpl, const LineItem& item,
                                 const Order* order, const ResolverOptions& options) {
    return expandPlaceholders(tmpl, [&](std::string_view name) -> std::optional<std::string> {
        if (name == "name") return item.name;
        if (name == "quantity") return std::to_string(item.quantity);
        if (name == "unitPrice") return formatAmount(item.unitPrice);
        if (name == "totalPrice") return formatAmount(item.totalPrice);
        if (name == "sku") return item.sku.value_or("");
        if (name == "category") return item.category.value_or("");
        if (name == "modifiers") return joinModifiers(item.modifiers);

        if (isKnownField(name)) return resolveField(name, order, options);
        return std::nullopt;
    });
}

//=============================================================================
// ItemListRenderer
//=============================================================================

void ItemListRenderer::render(const ItemsListElement& element, const Order& order) {
    for (const auto& item : order.items) {
        if (!element.itemTemplate.empty()) {
            renderTemplate(element.itemTemplate, item, order);
        } else {
            renderFallback(item);
        }
        renderDetails(element, item);
        _out.feed(1);
    }

    if (!order.itemPromotions.empty()) {
        renderItemPromotions(order);
    }
    if (!order.orderPromotions.empty()) {
        renderOrderPromotions(order);
    }
}

void ItemListRenderer::renderTemplate(const std::string& tmpl, const LineItem& item,
                                      const Order& order) {
    const std::string filled = substituteItemFields(tmpl, item, &order, _options);

    // Each item starts LEFT; directives carry over to the item's later lines
    AlignmentState lineAlignment;
    for (const auto& ins : _parser.parseTemplate(filled)) {
        switch (ins.type) {
            case LineInstruction::Type::SetAlignment:
                lineAlignment.setAlignment(ins.alignment);
                break;
            case LineInstruction::Type::Feed:
                _out.feed(ins.lines);
                break;
            case LineInstruction::Type::Text:
                _out.ensureAlignment(lineAlignment.currentAlignment());
                _out.text(ins.text);
                break;
        }
    }

    for (const auto& warning : _parser.warnings()) {
        spdlog::debug("items_list '{}': {}", item.name, warning);
    }
}

void ItemListRenderer::renderFallback(const LineItem& item) {
    std::string line = item.quantity > 1
        ? std::to_string(item.quantity) + "x " + item.name
        : item.name;

    _out.ensureAlignment(Alignment::Left);
    _out.text(std::move(line));
    _out.align(Alignment::Right);
    _out.text(formatMoney(item.totalPrice, _options));
    _out.align(Alignment::Left);
}

void ItemListRenderer::renderDetails(const ItemsListElement& element, const LineItem& item) {
    const bool sku = element.showSku && item.sku.has_value();
    const bool category = element.showCategory && item.category.has_value();
    const bool modifiers = element.showModifiers && !item.modifiers.empty();

    if (sku || category || modifiers) {
        _out.ensureAlignment(Alignment::Left);
    }
    if (sku) {
        _out.text("  SKU: " + *item.sku, DETAIL_STYLE);
    }
    if (category) {
        _out.text("  Category: " + *item.category, DETAIL_STYLE);
    }
    if (modifiers) {
        for (const auto& modifier : item.modifiers) {
            _out.text("  + " + modifier, DETAIL_STYLE);
        }
    }

    if (element.showUnitPrice && item.quantity > 1) {
        _out.align(Alignment::Right);
        _out.text(formatMoney(item.unitPrice, _options) + " ea", DETAIL_STYLE);
        _out.align(Alignment::Left);
    }
}

void ItemListRenderer::renderItemPromotions(const Order& order) {
    _out.feed(1);
    _out.ensureAlignment(Alignment::Left);
    _out.text("ITEM DISCOUNTS:", HEADER_STYLE);
    for (const auto& promo : order.itemPromotions) {
        renderDiscountLine(promo.promotionName, promo.discountAmount);
    }
    _out.feed(1);
}

void ItemListRenderer::renderOrderPromotions(const Order& order) {
    _out.ensureAlignment(Alignment::Left);
    _out.text("ORDER DISCOUNTS:", HEADER_STYLE);
    for (const auto& promo : order.orderPromotions) {
        std::string label = promo.promotionName;
        if (promo.promotionType == PromotionType::Percentage) {
            label += " (" + formatPercent(promo.discountAmount) + ")";
        }
        renderDiscountLine(label, promo.discountAmount);
    }
    _out.feed(1);
}

void ItemListRenderer::renderDiscountLine(const std::string& label, double amount) {
    _out.text(label);
    _out.align(Alignment::Right);
    _out.text("-" + formatMoney(amount, _options));
    _out.align(Alignment::Left);
}

} // namespace slip
