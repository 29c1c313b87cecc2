#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "checkout/types.hpp"

namespace checkout {

enum class ConditionKind : uint8_t {
  Any           = 0,
  ProductEquals = 1,
  EveryNth      = 2,
  AfterCount    = 3
};

struct ConditionCheck;

// Stateful predicate evaluated once per product reaching it.
//
// A Condition is a small tree: every kind except Any wraps an inner condition
// which is only consulted when the outer one lets the product through. Checking
// never mutates; it returns the condition state to use for the next product.
// Copies are deep, so two rules never share counters. A moved-from condition
// is Any.
class Condition {
public:
  Condition() = default;
  Condition(const Condition& other);
  Condition(Condition&& other) noexcept;
  Condition& operator=(const Condition& other);
  Condition& operator=(Condition&& other) noexcept;
  ~Condition() = default;

  // Always satisfied
  static Condition any() { return Condition{}; }

  // Satisfied when the product has `code` and `inner` is satisfied
  static Condition product_equals(ProductCode code, Condition inner = any());

  // Satisfied on every n-th product reaching it (n > 0)
  static Condition every_nth(int64_t n, Condition inner = any());

  // Satisfied once `threshold` products have already reached it (threshold > 0)
  static Condition after_count(int64_t threshold, Condition inner = any());

  ConditionCheck check(const Product& product) const;

  ConditionKind kind() const noexcept { return kind_; }
  const ProductCode& code() const noexcept { return code_; }
  int64_t limit() const noexcept { return limit_; }
  int64_t counter() const noexcept { return counter_; }
  const Condition* inner() const noexcept { return inner_.get(); }

  std::string describe() const;

private:
  Condition(ConditionKind kind, ProductCode code, int64_t limit, Condition inner);

  Condition advanced(int64_t counter, Condition inner) const;
  void reset() noexcept;

  ConditionKind kind_{ConditionKind::Any};
  ProductCode code_{};
  int64_t limit_{0};   // n for EveryNth, threshold for AfterCount
  int64_t counter_{0};
  std::unique_ptr<Condition> inner_{};
};

struct ConditionCheck {
  bool      applies{false};
  Condition next{};
};

} // namespace checkout
