#include <gtest/gtest.h>
#include "checkout/discount.hpp"

TEST(Discount, DefaultIsZero) {
  checkout::Discount d;
  EXPECT_TRUE(d.is_absolute());
  EXPECT_EQ(d.compute(1000), 0);
}

TEST(Discount, AbsoluteIgnoresPrice) {
  auto d = checkout::Discount::absolute(-100);
  EXPECT_TRUE(d.is_absolute());
  EXPECT_EQ(d.compute(0), -100);
  EXPECT_EQ(d.compute(311), -100);
  EXPECT_EQ(d.compute(1'000'000), -100);
}

TEST(Discount, ShareTruncatesTowardZero) {
  auto third = checkout::Discount::share(-1, 3);
  EXPECT_FALSE(third.is_absolute());
  EXPECT_EQ(third.compute(1123), -374);
  EXPECT_EQ(third.compute(2246), -748);
  EXPECT_EQ(third.compute(3369), -1123);
  EXPECT_EQ(third.compute(2), 0);
}

TEST(Discount, Percents) {
  EXPECT_EQ(checkout::Discount::percents(-100).compute(311), -311);
  EXPECT_EQ(checkout::Discount::percents(-10).compute(311), -31);
  EXPECT_EQ(checkout::Discount::percents(-10).compute(0), 0);

  const auto tenth = checkout::Discount::percents(-10);
  const auto& r = std::get<checkout::Ratio>(tenth.amount());
  EXPECT_EQ(r.num(), -1);
  EXPECT_EQ(r.den(), 10);
}

TEST(Discount, ShareOfLargePriceIsExact) {
  EXPECT_EQ(checkout::Discount::share(-2, 3).compute(int64_t{1} << 62), -3074457345618258602LL);
  EXPECT_EQ(checkout::Discount::absolute(-50).compute(INT64_MAX), -50);
}

TEST(Discount, ShareRejectsNonPositiveDenominator) {
  EXPECT_THROW(checkout::Discount::share(-1, 0), std::invalid_argument);
  EXPECT_THROW(checkout::Discount::share(-1, -3), std::invalid_argument);
}

TEST(Discount, BulkStartsAtZeroTotal) {
  auto b = checkout::bulk(checkout::Discount::share(-1, 3));
  EXPECT_EQ(b.total, 0);
  EXPECT_EQ(b.discount.compute(3000), -1000);
}
