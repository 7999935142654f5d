#include <slip/value-resolver.h>
#include <fmt/format.h>

#include <chrono>
#include <unordered_map>

namespace slip {

namespace {

using FieldFn = std::string (*)(const Order*, const ResolverOptions&);

const std::string& orDefault(const std::optional<std::string>& value, const std::string& fallback) {
    return value ? *value : fallback;
}

// Resolution table keyed by field name; each entry owns its default
const std::unordered_map<std::string_view, FieldFn>& fieldTable() {
    static const std::unordered_map<std::string_view, FieldFn> table = {
        // Basic order fields
        {"STORE_NAME", [](const Order* o, const ResolverOptions&) -> std::string {
            return o ? o->storeName : "Store Name";
        }},
        {"STORE_NUMBER", [](const Order* o, const ResolverOptions&) -> std::string {
            return o ? o->storeNumber : "001";
        }},
        {"ORDER_ID", [](const Order* o, const ResolverOptions&) -> std::string {
            return o ? o->orderId : "ORD123456";
        }},
        {"TIMESTAMP", [](const Order* o, const ResolverOptions& opts) -> std::string {
            return o ? formatTimestamp(o->timestamp, opts.utcOffsetMinutes) : "N/A";
        }},
        {"SUBTOTAL", [](const Order* o, const ResolverOptions& opts) -> std::string {
            return formatMoney(o ? o->subtotal : 0.0, opts);
        }},
        {"TAX_RATE", [](const Order* o, const ResolverOptions&) -> std::string {
            return formatPercent(o ? o->taxRate * 100.0 : 0.0);
        }},
        {"TAX", [](const Order* o, const ResolverOptions& opts) -> std::string {
            return formatMoney(o ? o->taxAmount : 0.0, opts);
        }},
        {"TOTAL", [](const Order* o, const ResolverOptions& opts) -> std::string {
            return formatMoney(o ? o->totalAmount : 0.0, opts);
        }},
        {"PAYMENT_METHOD", [](const Order* o, const ResolverOptions&) -> std::string {
            return o && o->paymentMethod ? *o->paymentMethod : "Cash";
        }},
        {"ITEM_COUNT", [](const Order* o, const ResolverOptions&) -> std::string {
            return std::to_string(o ? o->items.size() : 0);
        }},
        {"TOTAL_QUANTITY", [](const Order* o, const ResolverOptions&) -> std::string {
            return std::to_string(o ? o->totalQuantity() : 0);
        }},

        // Customer info fields
        {"CUSTOMER_ID", [](const Order* o, const ResolverOptions&) -> std::string {
            return o && o->customerInfo ? o->customerInfo->customerId : "GUEST001";
        }},
        {"CUSTOMER_NAME", [](const Order* o, const ResolverOptions&) -> std::string {
            return o && o->customerInfo ? o->customerInfo->name : "Guest";
        }},
        {"MEMBER_STATUS", [](const Order* o, const ResolverOptions&) -> std::string {
            static const std::string fallback = "Regular";
            return o && o->customerInfo ? orDefault(o->customerInfo->memberStatus, fallback) : fallback;
        }},
        {"LOYALTY_POINTS", [](const Order* o, const ResolverOptions&) -> std::string {
            return o && o->customerInfo ? std::to_string(o->customerInfo->loyaltyPoints) : "0";
        }},
        {"MEMBER_SINCE", [](const Order* o, const ResolverOptions&) -> std::string {
            static const std::string fallback = "N/A";
            return o && o->customerInfo ? orDefault(o->customerInfo->memberSince, fallback) : fallback;
        }},

        // Table info fields
        {"TABLE_NUMBER", [](const Order* o, const ResolverOptions&) -> std::string {
            return o && o->tableInfo ? o->tableInfo->tableNumber : "N/A";
        }},
        {"SERVER_NAME", [](const Order* o, const ResolverOptions&) -> std::string {
            return o && o->tableInfo ? o->tableInfo->serverName : "Server";
        }},
        {"GUEST_COUNT", [](const Order* o, const ResolverOptions&) -> std::string {
            return o && o->tableInfo ? std::to_string(o->tableInfo->guestCount) : "1";
        }},
        {"SERVICE_RATING", [](const Order* o, const ResolverOptions&) -> std::string {
            if (o && o->tableInfo && o->tableInfo->serviceRating) {
                return std::to_string(*o->tableInfo->serviceRating);
            }
            return "N/A";
        }},

        // No order field backs the cashier yet
        {"CASHIER_NAME", [](const Order*, const ResolverOptions&) -> std::string {
            return "Cashier";
        }},
    };
    return table;
}

} // namespace

//=============================================================================
// Formatting
//=============================================================================

std::string formatAmount(double value) {
    return fmt::format("{:.2f}", value);
}

std::string formatMoney(double value, const ResolverOptions& options) {
    return options.currencySymbol + formatAmount(value);
}

std::string formatPercent(double value) {
    return fmt::format("{:.1f}%", value);
}

std::string formatTimestamp(int64_t epochMillis, int utcOffsetMinutes) {
    using namespace std::chrono;
    const sys_time<milliseconds> tp{milliseconds{epochMillis} + minutes{utcOffsetMinutes}};
    const auto day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss<minutes> hms{floor<minutes>(tp - day)};

    return fmt::format("{:02}/{:02}/{:04} {:02}:{:02}",
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       static_cast<int>(ymd.year()),
                       hms.hours().count(),
                       hms.minutes().count());
}

//=============================================================================
// Placeholder expansion
//=============================================================================

std::string expandPlaceholders(std::string_view text, const PlaceholderLookup& lookup) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));

        size_t close = text.find("}}", open + 2);
        if (close == std::string_view::npos) {
            out.append(text.substr(open));
            break;
        }

        std::string_view name = text.substr(open + 2, close - open - 2);
        if (auto value = lookup(name)) {
            out += *value;
            pos = close + 2;
        } else {
            // Not ours: keep one brace and rescan, "{{{{TOTAL}}" still resolves
            out += text[open];
            pos = open + 1;
        }
    }
    return out;
}

const std::vector<std::string>& knownFields() {
    static const std::vector<std::string> names = {
        "STORE_NAME", "STORE_NUMBER", "ORDER_ID", "TIMESTAMP",
        "SUBTOTAL", "TAX_RATE", "TAX", "TOTAL", "PAYMENT_METHOD",
        "ITEM_COUNT", "TOTAL_QUANTITY",
        "CUSTOMER_ID", "CUSTOMER_NAME", "MEMBER_STATUS", "LOYALTY_POINTS", "MEMBER_SINCE",
        "TABLE_NUMBER", "SERVER_NAME", "GUEST_COUNT", "SERVICE_RATING",
        "CASHIER_NAME",
    };
    return names;
}

bool isKnownField(std::string_view name) {
    return fieldTable().count(name) > 0;
}

std::string resolveField(std::string_view name, const Order* order, const ResolverOptions& options) {
    const auto& table = fieldTable();
    auto it = table.find(name);
    if (it == table.end()) {
        return std::string(name);
    }
    return it->second(order, options);
}

std::string substitutePlaceholders(std::string_view text, const Order* order,
                                   const ResolverOptions& options) {
    const auto& table = fieldTable();
    return expandPlaceholders(text, [&](std::string_view name) -> std::optional<std::string> {
        auto it = table.find(name);
        if (it == table.end()) return std::nullopt;
        return it->second(order, options);
    });
}

} // namespace slip
