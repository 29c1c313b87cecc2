#include "checkout/cart.hpp"

#include <utility>

namespace checkout {

Cart Cart::empty(std::vector<Rule> rules) {
  return Cart(std::move(rules));
}

Cart Cart::add(const Product& product) const& {
  Cart next = *this;
  next.push(product);
  return next;
}

Cart Cart::add(const Product& product) && {
  push(product);
  return std::move(*this);
}

// One copy of the cart for the whole batch, then fold in place
Cart Cart::add(std::span<const Product> products) const& {
  Cart out = *this;
  for (const auto& p : products) out.push(p);
  return out;
}

Cart Cart::add(std::span<const Product> products) && {
  for (const auto& p : products) push(p);
  return std::move(*this);
}

void Cart::push(const Product& product) {
  products_.push_back(product);

  // Rules see the product in list order and never each other's state
  for (auto& r : rules_) r = std::move(r).apply(product);

  price_ += product.price;
}

Amount Cart::total() const noexcept {
  Amount discounts = 0;
  for (const auto& r : rules_) discounts += r.total();
  return price_ + discounts;
}

std::vector<CartItem> Cart::items() const {
  std::vector<CartItem> out;
  out.reserve(products_.size());
  for (auto it = products_.rbegin(); it != products_.rend(); ++it) out.emplace_back(*it);
  for (const auto& d : discounts()) out.emplace_back(d);
  return out;
}

std::vector<DiscountItem> Cart::discounts() const {
  std::vector<DiscountItem> out;
  for (const auto& r : rules_) {
    auto visible = r.items();
    out.insert(out.end(), visible.begin(), visible.end());
  }
  return out;
}

} // namespace checkout
