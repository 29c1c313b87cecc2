#pragma once
#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace checkout {

// Exact rational number with a positive denominator, kept in lowest terms.
// Arithmetic never wraps: results that do not fit in int64_t throw
// std::overflow_error.
class Ratio {
public:
  constexpr Ratio() = default;
  constexpr Ratio(int64_t num, int64_t den = 1) : num_(num), den_(den) {
    if (den_ == 0) throw std::invalid_argument("Ratio: zero denominator");
    // INT64_MIN has no positive counterpart for gcd or sign normalisation
    if (num_ == kMin || den_ == kMin) throw std::overflow_error("Ratio: INT64_MIN is out of range");
    if (den_ < 0) {
      num_ = -num_;
      den_ = -den_;
    }
    const int64_t g = std::gcd(num_, den_);
    if (g > 1) {
      num_ /= g;
      den_ /= g;
    }
  }

  constexpr int64_t num() const noexcept { return num_; }
  constexpr int64_t den() const noexcept { return den_; }

  // Truncates toward zero
  constexpr int64_t trunc() const noexcept { return num_ / den_; }

  // trunc(value * num / den) without forming value * num.
  // With value = q * den + r, both q * num and r * num / den carry the sign of
  // value * num, so truncating the fractional part alone is exact.
  constexpr int64_t mul_trunc(int64_t value) const {
    const int64_t q = value / den_;
    const int64_t r = value % den_;
    const int64_t whole = checked_mul(q, num_);
    const int64_t part = checked_mul(r, num_) / den_;
    return checked_add(whole, part);
  }

  // Cross-reduce before multiplying so the intermediate products stay small.
  friend constexpr Ratio operator*(const Ratio& a, const Ratio& b) {
    const int64_t g1 = std::gcd(a.num_, b.den_);
    const int64_t g2 = std::gcd(b.num_, a.den_);
    const int64_t n1 = g1 > 1 ? a.num_ / g1 : a.num_;
    const int64_t d2 = g1 > 1 ? b.den_ / g1 : b.den_;
    const int64_t n2 = g2 > 1 ? b.num_ / g2 : b.num_;
    const int64_t d1 = g2 > 1 ? a.den_ / g2 : a.den_;
    return Ratio(checked_mul(n1, n2), checked_mul(d1, d2));
  }

  friend constexpr bool operator==(const Ratio&, const Ratio&) = default;

private:
  static constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

  static constexpr int64_t checked_mul(int64_t a, int64_t b) {
    int64_t out{};
    if (__builtin_mul_overflow(a, b, &out)) throw std::overflow_error("Ratio: multiplication overflow");
    return out;
  }

  static constexpr int64_t checked_add(int64_t a, int64_t b) {
    int64_t out{};
    if (__builtin_add_overflow(a, b, &out)) throw std::overflow_error("Ratio: addition overflow");
    return out;
  }

  int64_t num_{0};
  int64_t den_{1};
};

} // namespace checkout
