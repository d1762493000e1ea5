#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nl2sql::name_aliases {

/// "InvoiceLine" -> "invoice_line"; snake_case input is only lowercased.
[[nodiscard]] std::string to_snake_case(std::string_view name);

/**
 * @brief Match terms generated from a column name
 *
 * Lowercase name, its snake_case form and the snake_case words separated
 * by spaces: "BillingCountry" -> billingcountry, billing_country,
 * billing country. Order is stable and entries are unique.
 */
[[nodiscard]] std::vector<std::string> for_column(std::string_view name);

/**
 * @brief Match terms generated from a table name or alias
 *
 * The column terms plus singular/plural counterparts of each
 * ("customers" -> customer, "track" -> tracks, tracks es-form).
 * Non-ASCII names are only lowercased.
 */
[[nodiscard]] std::vector<std::string> for_table(std::string_view name);

} // namespace nl2sql::name_aliases
