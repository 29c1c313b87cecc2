#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "checkout/cart.hpp"
#include "checkout/condition.hpp"
#include "checkout/discount.hpp"
#include "checkout/receipt.hpp"
#include "checkout/rule.hpp"

using checkout::Condition;
using checkout::Discount;

// Stand-in for an external price service
static std::optional<checkout::Product> lookup(const std::string& code) {
  if (code == "GR1") return checkout::Product{code, "Green tea", 311};
  if (code == "SR1") return checkout::Product{code, "Strawberries", 500};
  if (code == "CF1") return checkout::Product{code, "Coffee", 1123};
  return std::nullopt;
}

static std::vector<checkout::Rule> promotions() {
  return {
      checkout::Rule("Buy a Green tea get one FREE!",
                     Discount::percents(-100),
                     {.precondition = Condition::product_equals("GR1", Condition::every_nth(2))}),
      checkout::Rule("3+ Strawberries 4.50 EACH!",
                     Discount::absolute(-50),
                     {.precondition = Condition::product_equals("SR1"),
                      .postcondition = Condition::after_count(2)}),
      checkout::Rule("3+ Coffees 1/3 OFF ALL!",
                     checkout::bulk(Discount::share(-1, 3)),
                     {.precondition = Condition::product_equals("CF1"),
                      .postcondition = Condition::after_count(2)}),
  };
}

int main(int argc, char** argv) {
  std::string csv_path;
  std::vector<std::string> codes;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--csv=", 0) == 0) {
      csv_path = arg.substr(6);
    } else {
      codes.push_back(arg);
    }
  }

  if (codes.empty()) {
    std::cerr << "usage: " << argv[0] << " [--csv=<path>] CODE...\n";
    for (const auto& r : promotions()) std::cerr << "  " << r.describe() << "\n";
    return 1;
  }

  std::vector<checkout::Product> basket;
  basket.reserve(codes.size());
  for (const auto& c : codes) {
    auto p = lookup(c);
    if (!p) {
      std::cerr << "unknown product code: " << c << "\n";
      return 2;
    }
    basket.push_back(*p);
  }

  const auto cart = checkout::Cart::empty(promotions()).add(basket);

  checkout::write_receipt(std::cout, cart);

  if (!csv_path.empty() && !checkout::write_receipt_csv(csv_path, cart)) {
    std::cerr << "cannot write " << csv_path << "\n";
    return 3;
  }

  std::cout << "items=" << cart.products().size()
            << " subtotal=" << cart.price()
            << " total=" << cart.total()
            << "\n";

  return 0;
}
