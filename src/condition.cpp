#include "checkout/condition.hpp"

#include <stdexcept>
#include <utility>

namespace checkout {

Condition::Condition(const Condition& other)
    : kind_(other.kind_),
      code_(other.code_),
      limit_(other.limit_),
      counter_(other.counter_),
      inner_(other.inner_ ? std::make_unique<Condition>(*other.inner_) : nullptr) {}

Condition::Condition(Condition&& other) noexcept
    : kind_(other.kind_),
      code_(std::move(other.code_)),
      limit_(other.limit_),
      counter_(other.counter_),
      inner_(std::move(other.inner_)) {
  other.reset();
}

Condition& Condition::operator=(Condition&& other) noexcept {
  if (this != &other) {
    // `other` may live inside inner_; detach it before inner_ is replaced
    Condition tmp(std::move(other));
    kind_ = tmp.kind_;
    code_ = std::move(tmp.code_);
    limit_ = tmp.limit_;
    counter_ = tmp.counter_;
    inner_ = std::move(tmp.inner_);
  }
  return *this;
}

void Condition::reset() noexcept {
  kind_ = ConditionKind::Any;
  code_.clear();
  limit_ = 0;
  counter_ = 0;
  inner_.reset();
}

Condition& Condition::operator=(const Condition& other) {
  if (this != &other) {
    Condition tmp(other);
    *this = std::move(tmp);
  }
  return *this;
}

Condition::Condition(ConditionKind kind, ProductCode code, int64_t limit, Condition inner)
    : kind_(kind),
      code_(std::move(code)),
      limit_(limit),
      counter_(0),
      inner_(std::make_unique<Condition>(std::move(inner))) {}

Condition Condition::product_equals(ProductCode code, Condition inner) {
  return Condition(ConditionKind::ProductEquals, std::move(code), 0, std::move(inner));
}

Condition Condition::every_nth(int64_t n, Condition inner) {
  if (n <= 0) throw std::invalid_argument("Condition::every_nth: n must be positive");
  return Condition(ConditionKind::EveryNth, ProductCode{}, n, std::move(inner));
}

Condition Condition::after_count(int64_t threshold, Condition inner) {
  if (threshold <= 0) throw std::invalid_argument("Condition::after_count: threshold must be positive");
  return Condition(ConditionKind::AfterCount, ProductCode{}, threshold, std::move(inner));
}

Condition Condition::advanced(int64_t counter, Condition inner) const {
  Condition next(kind_, code_, limit_, std::move(inner));
  next.counter_ = counter;
  return next;
}

ConditionCheck Condition::check(const Product& product) const {
  switch (kind_) {
    case ConditionKind::Any:
      return ConditionCheck{true, *this};

    case ConditionKind::ProductEquals: {
      if (product.code != code_) return ConditionCheck{false, *this};
      auto in = inner_->check(product);
      return ConditionCheck{in.applies, advanced(counter_, std::move(in.next))};
    }

    case ConditionKind::EveryNth: {
      if (counter_ + 1 != limit_) return ConditionCheck{false, advanced(counter_ + 1, *inner_)};
      auto in = inner_->check(product);
      return ConditionCheck{in.applies, advanced(0, std::move(in.next))};
    }

    case ConditionKind::AfterCount: {
      // Counts every evaluation, including the ones that pass
      if (counter_ < limit_) return ConditionCheck{false, advanced(counter_ + 1, *inner_)};
      auto in = inner_->check(product);
      return ConditionCheck{in.applies, advanced(counter_ + 1, std::move(in.next))};
    }
  }
  return ConditionCheck{false, *this};
}

std::string Condition::describe() const {
  switch (kind_) {
    case ConditionKind::Any:
      return "any";
    case ConditionKind::ProductEquals:
      return "product(" + code_ + ", " + inner_->describe() + ")";
    case ConditionKind::EveryNth:
      return "every_nth(" + std::to_string(limit_) + ", " + inner_->describe() + ")";
    case ConditionKind::AfterCount:
      return "after_count(" + std::to_string(limit_) + ", " + inner_->describe() + ")";
  }
  return "unknown";
}

} // namespace checkout
