#pragma once

#include <slip/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace slip {

//=============================================================================
// Order data (read-only input to a render pass)
//=============================================================================

struct CustomerInfo {
    std::string customerId;
    std::string name;
    std::optional<std::string> memberStatus;
    int loyaltyPoints = 0;
    std::optional<std::string> memberSince;
};

struct TableInfo {
    std::string tableNumber;
    std::string serverName;
    int guestCount = 1;
    std::optional<int> serviceRating;
};

struct LineItem {
    std::string name;
    int quantity = 1;
    double unitPrice = 0.0;
    double totalPrice = 0.0;
    std::optional<std::string> sku;
    std::optional<std::string> category;
    std::vector<std::string> modifiers;
};

struct ItemPromotion {
    std::string promotionName;
    double discountAmount = 0.0;
};

enum class PromotionType : uint8_t {
    Fixed,
    Percentage
};

struct OrderPromotion {
    std::string promotionName;
    double discountAmount = 0.0;
    PromotionType promotionType = PromotionType::Fixed;
};

struct Order {
    std::string storeName;
    std::string storeNumber;
    std::string orderId;
    int64_t timestamp = 0;          // epoch milliseconds
    double subtotal = 0.0;
    double taxRate = 0.0;           // fraction: 0.08 is 8%
    double taxAmount = 0.0;
    double totalAmount = 0.0;
    std::optional<std::string> paymentMethod;
    std::optional<CustomerInfo> customerInfo;
    std::optional<TableInfo> tableInfo;
    std::vector<LineItem> items;
    std::vector<ItemPromotion> itemPromotions;
    std::vector<OrderPromotion> orderPromotions;

    int totalQuantity() const;
};

/**
 * Decode an order record. Absent keys keep their defaults; a record that is
 * not a map, or list fields that are not sequences, fail.
 */
Result<Order> decodeOrder(const YAML::Node& node);

} // namespace slip
