#pragma once
#include <cstdint>
#include <variant>

#include "checkout/ratio.hpp"
#include "checkout/types.hpp"

namespace checkout {

// Either an absolute amount or a share of the price it is computed from
using DiscountAmount = std::variant<Amount, Ratio>;

class Discount {
public:
  Discount() = default;

  static Discount absolute(Amount amount) noexcept;
  static Discount share(int64_t parts, int64_t of);
  static Discount percents(int64_t percents);

  // Absolute amounts ignore the price; shares are truncated toward zero.
  // Throws std::overflow_error only if the result does not fit in an Amount.
  Amount compute(Amount price) const;

  bool is_absolute() const noexcept { return std::holds_alternative<Amount>(amount_); }
  const DiscountAmount& amount() const noexcept { return amount_; }

private:
  explicit Discount(DiscountAmount amount) noexcept : amount_(amount) {}

  DiscountAmount amount_{Amount{0}};
};

// Recomputed from the running total of every qualifying price seen so far.
struct BulkDiscount {
  Amount   total{0};
  Discount discount{};
};

inline BulkDiscount bulk(Discount discount) noexcept {
  return BulkDiscount{0, discount};
}

using DiscountSpec = std::variant<Discount, BulkDiscount>;

} // namespace checkout
