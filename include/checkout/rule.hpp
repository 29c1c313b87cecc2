#pragma once
#include <string>
#include <vector>

#include "checkout/condition.hpp"
#include "checkout/discount.hpp"
#include "checkout/types.hpp"

namespace checkout {

struct RuleOptions {
  // Gates whether a product is processed by the rule at all
  Condition precondition{};

  // Gates whether the items produced so far count toward the total
  Condition postcondition{};
};

class Rule {
public:
  explicit Rule(DiscountSpec definition, RuleOptions opts = {});
  Rule(std::string name, DiscountSpec definition, RuleOptions opts = {});

  // Evaluate the rule against the next product added to a cart.
  Rule apply(const Product& product) const&;
  Rule apply(const Product& product) &&;

  // Items visible on a receipt: everything produced so far while active, else nothing
  std::vector<DiscountItem> items() const;
  Amount total() const noexcept;

  const std::string& name() const noexcept { return name_; }
  const DiscountSpec& definition() const noexcept { return definition_; }
  const Condition& precondition() const noexcept { return precondition_; }
  const Condition& postcondition() const noexcept { return postcondition_; }
  bool active() const noexcept { return active_; }
  const std::vector<DiscountItem>& produced_items() const noexcept { return produced_; }
  bool is_bulk() const noexcept { return std::holds_alternative<BulkDiscount>(definition_); }

  std::string describe() const;

private:
  void step(const Product& product);
  void produce(const Product& product);

  std::string name_{"<unnamed>"};
  Condition precondition_{};
  DiscountSpec definition_{};
  Condition postcondition_{};
  bool active_{false};
  std::vector<DiscountItem> produced_{};
};

} // namespace checkout
