#pragma once
#include <ostream>
#include <string>

#include "checkout/cart.hpp"
#include "checkout/types.hpp"

namespace checkout {

// 2245 -> "22.45", -374 -> "-3.74"
std::string format_amount(Amount amount);

// CSV: kind,code,name,amount  (one row per visible item, then the total)
void write_receipt(std::ostream& os, const Cart& cart);
bool write_receipt_csv(const std::string& path, const Cart& cart);

} // namespace checkout
