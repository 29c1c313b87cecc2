#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace checkout {

// Money in minor currency units (pence). Discounts are negative.
using Amount = int64_t;
using ProductCode = std::string;

struct Product {
  ProductCode code{};
  std::string name{"<empty>"};
  Amount      price{0};
};

// Synthetic negative-priced line produced by a Rule
struct DiscountItem {
  std::string name{"<empty>"};
  Amount      amount{0};
};

// One receipt line: either a purchased product or a discount
using CartItem = std::variant<Product, DiscountItem>;

inline bool is_discount(const CartItem& item) noexcept {
  return std::holds_alternative<DiscountItem>(item);
}

inline Amount item_amount(const CartItem& item) noexcept {
  if (const auto* d = std::get_if<DiscountItem>(&item)) return d->amount;
  return std::get_if<Product>(&item)->price;
}

inline const std::string& item_name(const CartItem& item) noexcept {
  if (const auto* d = std::get_if<DiscountItem>(&item)) return d->name;
  return std::get_if<Product>(&item)->name;
}

} // namespace checkout
