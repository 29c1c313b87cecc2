#include "checkout/discount.hpp"

#include <stdexcept>

namespace checkout {

Discount Discount::absolute(Amount amount) noexcept {
  return Discount{DiscountAmount{amount}};
}

Discount Discount::share(int64_t parts, int64_t of) {
  if (of <= 0) throw std::invalid_argument("Discount::share: denominator must be positive");
  return Discount{DiscountAmount{Ratio(parts, of)}};
}

Discount Discount::percents(int64_t percents) {
  return share(percents, 100);
}

Amount Discount::compute(Amount price) const {
  if (const auto* abs = std::get_if<Amount>(&amount_)) return *abs;
  return std::get<Ratio>(amount_).mul_trunc(price);
}

} // namespace checkout
