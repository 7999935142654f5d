#pragma once

#include <slip/command-builder.h>
#include <slip/directive-parser.h>
#include <slip/element.h>
#include <slip/order.h>
#include <slip/value-resolver.h>

#include <string>
#include <string_view>

namespace slip {

/**
 * Fill an item template with one line item's values.
 *
 * Item placeholders: {{name}} {{quantity}} {{unitPrice}} {{totalPrice}}
 * {{sku}} {{category}} {{modifiers}}. Prices have two decimals and no
 * currency symbol; absent sku/category and an empty modifier list become "".
 * Order-level {{FIELD}} placeholders resolve in the same pass; anything else
 * (directives included) is left for the directive parser.
 */
std::string substituteItemFields(std::string_view tmpl, const LineItem& item,
                                 const Order* order, const ResolverOptions& options = {});

/**
 * ItemListRenderer - expands an `items_list` element for one order.
 *
 * Per item: the template (or the two-line fallback when the template is
 * empty), then the enabled detail lines (SKU, category, modifiers, unit
 * price), then one feed. After all items: item and order discount blocks.
 */
class ItemListRenderer {
public:
    ItemListRenderer(CommandBuilder& out, const ResolverOptions& options)
        : _out(out), _options(options) {}

    void render(const ItemsListElement& element, const Order& order);

private:
    void renderTemplate(const std::string& tmpl, const LineItem& item, const Order& order);
    void renderFallback(const LineItem& item);
    void renderDetails(const ItemsListElement& element, const LineItem& item);
    void renderItemPromotions(const Order& order);
    void renderOrderPromotions(const Order& order);

    // name left, "-$X.XX" right, back to LEFT
    void renderDiscountLine(const std::string& label, double amount);

    CommandBuilder& _out;
    const ResolverOptions& _options;
    DirectiveParser _parser;
};

} // namespace slip
