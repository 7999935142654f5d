#include <slip/order.h>
#include <yaml-cpp/yaml.h>

namespace slip {

namespace {

template<typename T>
T field(const YAML::Node& node, const char* key, const T& defaultValue) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) return defaultValue;
    return value.as<T>(defaultValue);
}

// Absent and null both mean "not set"
template<typename T>
std::optional<T> optionalField(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) return std::nullopt;
    T out;
    if (!YAML::convert<T>::decode(value, out)) return std::nullopt;
    return out;
}

Result<YAML::Node> sequenceField(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return Ok(YAML::Node(YAML::NodeType::Sequence));
    if (!value.IsSequence()) {
        return Err<YAML::Node>(std::string("order: '") + key + "' is not a list");
    }
    return Ok(YAML::Node(value));
}

CustomerInfo decodeCustomer(const YAML::Node& node) {
    CustomerInfo c;
    c.customerId = field<std::string>(node, "customerId", "");
    c.name = field<std::string>(node, "name", "");
    c.memberStatus = optionalField<std::string>(node, "memberStatus");
    c.loyaltyPoints = field<int>(node, "loyaltyPoints", 0);
    c.memberSince = optionalField<std::string>(node, "memberSince");
    return c;
}

TableInfo decodeTable(const YAML::Node& node) {
    TableInfo t;
    t.tableNumber = field<std::string>(node, "tableNumber", "");
    t.serverName = field<std::string>(node, "serverName", "");
    t.guestCount = field<int>(node, "guestCount", 1);
    t.serviceRating = optionalField<int>(node, "serviceRating");
    return t;
}

Result<LineItem> decodeItem(const YAML::Node& node) {
    if (!node.IsMap()) return Err<LineItem>("order item is not a map");

    LineItem item;
    item.name = field<std::string>(node, "name", "");
    item.quantity = field<int>(node, "quantity", 1);
    item.unitPrice = field<double>(node, "unitPrice", 0.0);
    item.totalPrice = field<double>(node, "totalPrice", item.unitPrice * item.quantity);
    item.sku = optionalField<std::string>(node, "sku");
    item.category = optionalField<std::string>(node, "category");

    auto modifiers = sequenceField(node, "modifiers");
    if (!modifiers) return Err<LineItem>("order item '" + item.name + "'", modifiers);
    for (const auto& m : *modifiers) {
        if (m.IsScalar()) item.modifiers.push_back(m.as<std::string>());
    }
    return Ok(std::move(item));
}

} // namespace

int Order::totalQuantity() const {
    int total = 0;
    for (const auto& item : items) total += item.quantity;
    return total;
}

Result<Order> decodeOrder(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return Err<Order>("order record is not a map");
    }

    Order order;
    order.storeName = field<std::string>(node, "storeName", "");
    order.storeNumber = field<std::string>(node, "storeNumber", "");
    order.orderId = field<std::string>(node, "orderId", "");
    order.timestamp = field<int64_t>(node, "timestamp", 0);
    order.subtotal = field<double>(node, "subtotal", 0.0);
    order.taxRate = field<double>(node, "taxRate", 0.0);
    order.taxAmount = field<double>(node, "taxAmount", 0.0);
    order.totalAmount = field<double>(node, "totalAmount", 0.0);
    order.paymentMethod = optionalField<std::string>(node, "paymentMethod");

    if (const YAML::Node customer = node["customerInfo"]; customer && customer.IsMap()) {
        order.customerInfo = decodeCustomer(customer);
    }
    if (const YAML::Node table = node["tableInfo"]; table && table.IsMap()) {
        order.tableInfo = decodeTable(table);
    }

    auto items = sequenceField(node, "items");
    if (!items) return Err<Order>("Failed to decode order", items);
    for (const auto& itemNode : *items) {
        auto item = decodeItem(itemNode);
        if (!item) return Err<Order>("Failed to decode order", item);
        order.items.push_back(std::move(*item));
    }

    auto itemPromos = sequenceField(node, "itemPromotions");
    if (!itemPromos) return Err<Order>("Failed to decode order", itemPromos);
    for (const auto& p : *itemPromos) {
        if (!p.IsMap()) return Err<Order>("item promotion is not a map");
        ItemPromotion promo;
        promo.promotionName = field<std::string>(p, "promotionName", "");
        promo.discountAmount = field<double>(p, "discountAmount", 0.0);
        order.itemPromotions.push_back(std::move(promo));
    }

    auto orderPromos = sequenceField(node, "orderPromotions");
    if (!orderPromos) return Err<Order>("Failed to decode order", orderPromos);
    for (const auto& p : *orderPromos) {
        if (!p.IsMap()) return Err<Order>("order promotion is not a map");
        OrderPromotion promo;
        promo.promotionName = field<std::string>(p, "promotionName", "");
        promo.discountAmount = field<double>(p, "discountAmount", 0.0);
        promo.promotionType = field<std::string>(p, "promotionType", "FIXED") == "PERCENTAGE"
            ? PromotionType::Percentage
            : PromotionType::Fixed;
        order.orderPromotions.push_back(std::move(promo));
    }

    return Ok(std::move(order));
}

} // namespace slip
