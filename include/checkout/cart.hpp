#pragma once
#include <span>
#include <utility>
#include <vector>

#include "checkout/rule.hpp"
#include "checkout/types.hpp"

namespace checkout {

// Ongoing purchase. Products can only be added; every add is folded through
// the cart's own copies of its rules.
class Cart {
public:
  Cart() = default;

  static Cart empty(std::vector<Rule> rules = {});

  Cart add(const Product& product) const&;
  Cart add(const Product& product) &&;
  Cart add(std::span<const Product> products) const&;
  Cart add(std::span<const Product> products) &&;

  // Raw price plus the discounts of every active rule
  Amount total() const noexcept;

  // Sum of raw product prices, independent of rule state
  Amount price() const noexcept { return price_; }

  const std::vector<Product>& products() const noexcept { return products_; }
  const std::vector<Rule>& rules() const noexcept { return rules_; }

  // Receipt lines: products newest first, then each rule's visible discounts
  std::vector<CartItem> items() const;
  std::vector<DiscountItem> discounts() const;

private:
  explicit Cart(std::vector<Rule> rules) : rules_(std::move(rules)) {}

  void push(const Product& product);

  std::vector<Product> products_{};
  std::vector<Rule> rules_{};
  Amount price_{0};
};

} // namespace checkout
