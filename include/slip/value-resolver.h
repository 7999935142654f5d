#pragma once

#include <slip/order.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slip {

struct ResolverOptions {
    std::string currencySymbol = "$";
    int utcOffsetMinutes = 0;       // applied to TIMESTAMP
};

/**
 * Look up a placeholder name. Returns nullopt when the name is not one the
 * caller knows, in which case the `{{...}}` token is left untouched.
 */
using PlaceholderLookup = std::function<std::optional<std::string>(std::string_view)>;

/**
 * Replace `{{name}}` tokens in one left-to-right pass.
 *
 * Substituted values are appended to the output and never rescanned. Unknown
 * tokens are copied through unchanged so template directives such as
 * `{{align:right}}` survive for the directive parser.
 */
std::string expandPlaceholders(std::string_view text, const PlaceholderLookup& lookup);

// The enumerated dynamic field names, in display order
const std::vector<std::string>& knownFields();

bool isKnownField(std::string_view name);

/**
 * Resolve a dynamic field against an order. `order` may be null; absent orders
 * and absent customer/table sub-records produce the field's default string.
 * Unknown names resolve to themselves.
 */
std::string resolveField(std::string_view name, const Order* order,
                         const ResolverOptions& options = {});

/**
 * Replace every known `{{FIELD}}` placeholder in `text`; unknown tokens are
 * left in place.
 */
std::string substitutePlaceholders(std::string_view text, const Order* order,
                                   const ResolverOptions& options = {});

// ─── Formatting helpers shared with the item renderer ───────────────────────

std::string formatAmount(double value);                              // "12.50"
std::string formatMoney(double value, const ResolverOptions& options); // "$12.50"
std::string formatPercent(double value);                             // "8.0%"
std::string formatTimestamp(int64_t epochMillis, int utcOffsetMinutes); // "03/15/2024 14:30"

} // namespace slip
