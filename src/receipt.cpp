#include "checkout/receipt.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace checkout {

// Quote a CSV field only when it needs it
static std::string csv_field(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string format_amount(Amount amount) {
  const bool neg = amount < 0;
  // Avoid negating INT64_MIN
  const uint64_t abs = neg ? static_cast<uint64_t>(-(amount + 1)) + 1u : static_cast<uint64_t>(amount);

  std::ostringstream ss;
  if (neg) ss << '-';
  ss << (abs / 100u) << '.' << std::setw(2) << std::setfill('0') << (abs % 100u);
  return ss.str();
}

void write_receipt(std::ostream& os, const Cart& cart) {
  os << "kind,code,name,amount\n";
  for (const auto& item : cart.items()) {
    if (const auto* p = std::get_if<Product>(&item)) {
      os << "product," << csv_field(p->code) << ",";
    } else {
      os << "discount,,";
    }
    os << csv_field(item_name(item)) << "," << format_amount(item_amount(item)) << "\n";
  }
  os << "total,,," << format_amount(cart.total()) << "\n";
}

bool write_receipt_csv(const std::string& path, const Cart& cart) {
  std::ofstream f(path);
  if (!f) return false;
  write_receipt(f, cart);
  return static_cast<bool>(f);
}

} // namespace checkout
