#include "checkout/rule.hpp"

#include <utility>

namespace checkout {

Rule::Rule(DiscountSpec definition, RuleOptions opts)
    : precondition_(std::move(opts.precondition)),
      definition_(std::move(definition)),
      postcondition_(std::move(opts.postcondition)) {}

Rule::Rule(std::string name, DiscountSpec definition, RuleOptions opts)
    : name_(std::move(name)),
      precondition_(std::move(opts.precondition)),
      definition_(std::move(definition)),
      postcondition_(std::move(opts.postcondition)) {}

Rule Rule::apply(const Product& product) const& {
  Rule next = *this;
  next.step(product);
  return next;
}

Rule Rule::apply(const Product& product) && {
  step(product);
  return std::move(*this);
}

void Rule::step(const Product& product) {
  auto pre = precondition_.check(product);
  precondition_ = std::move(pre.next);
  if (!pre.applies) return;

  produce(product);

  // Only products that passed the precondition reach the postcondition
  auto post = postcondition_.check(product);
  postcondition_ = std::move(post.next);
  active_ = post.applies;
}

void Rule::produce(const Product& product) {
  if (auto* b = std::get_if<BulkDiscount>(&definition_)) {
    b->total += product.price;
    produced_.assign(1, DiscountItem{name_, b->discount.compute(b->total)});
    return;
  }
  const auto& d = std::get<Discount>(definition_);
  produced_.push_back(DiscountItem{name_, d.compute(product.price)});
}

std::vector<DiscountItem> Rule::items() const {
  if (!active_) return {};
  return produced_;
}

Amount Rule::total() const noexcept {
  if (!active_) return 0;
  Amount sum = 0;
  for (const auto& it : produced_) sum += it.amount;
  return sum;
}

static std::string describe_discount(const Discount& d) {
  if (const auto* abs = std::get_if<Amount>(&d.amount())) return std::to_string(*abs);
  const auto& r = std::get<Ratio>(d.amount());
  return std::to_string(r.num()) + "/" + std::to_string(r.den());
}

std::string Rule::describe() const {
  std::string out = name_ + ": ";
  if (const auto* b = std::get_if<BulkDiscount>(&definition_)) {
    out += "bulk " + describe_discount(b->discount);
  } else {
    out += describe_discount(std::get<Discount>(definition_));
  }
  out += " when " + precondition_.describe();
  out += " counts after " + postcondition_.describe();
  return out;
}

} // namespace checkout
