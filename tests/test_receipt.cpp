#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "checkout/receipt.hpp"

using checkout::Condition;
using checkout::Discount;

TEST(Receipt, FormatAmount) {
  EXPECT_EQ(checkout::format_amount(0), "0.00");
  EXPECT_EQ(checkout::format_amount(5), "0.05");
  EXPECT_EQ(checkout::format_amount(311), "3.11");
  EXPECT_EQ(checkout::format_amount(2245), "22.45");
  EXPECT_EQ(checkout::format_amount(-374), "-3.74");
  EXPECT_EQ(checkout::format_amount(-50), "-0.50");
  EXPECT_EQ(checkout::format_amount(INT64_MIN), "-92233720368547758.08");
}

TEST(Receipt, CsvRowsAndTotal) {
  auto cart = checkout::Cart::empty({
                  checkout::Rule("Tea, half price", Discount::percents(-50),
                                 {.precondition = Condition::product_equals("GR1")}),
              })
                  .add(checkout::Product{"GR1", "Green tea", 311});

  std::ostringstream ss;
  checkout::write_receipt(ss, cart);

  EXPECT_EQ(ss.str(),
            "kind,code,name,amount\n"
            "product,GR1,Green tea,3.11\n"
            "discount,,\"Tea, half price\",-1.55\n"
            "total,,,1.56\n");
}

TEST(Receipt, QuotesEmbeddedQuotes) {
  auto cart = checkout::Cart::empty().add(checkout::Product{"X1", "The \"best\" tea", 100});

  std::ostringstream ss;
  checkout::write_receipt(ss, cart);
  EXPECT_NE(ss.str().find("product,X1,\"The \"\"best\"\" tea\",1.00\n"), std::string::npos);
}

TEST(Receipt, WritesCsvFile) {
  auto cart = checkout::Cart::empty().add(checkout::Product{"SR1", "Strawberries", 500});

  const std::string path = ::testing::TempDir() + "checkout_receipt_test.csv";
  ASSERT_TRUE(checkout::write_receipt_csv(path, cart));

  std::ifstream f(path);
  std::stringstream body;
  body << f.rdbuf();
  EXPECT_EQ(body.str(), "kind,code,name,amount\nproduct,SR1,Strawberries,5.00\ntotal,,,5.00\n");
  std::remove(path.c_str());
}

TEST(Receipt, UnwritablePathReportsFailure) {
  auto cart = checkout::Cart::empty();
  EXPECT_FALSE(checkout::write_receipt_csv("/nonexistent-dir/receipt.csv", cart));
}
