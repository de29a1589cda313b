#pragma once

#include <cstdint>
#include <string>

namespace splitlens {

// All money is carried as a signed count of cents.
using Cents = std::int64_t;

// Largest magnitude accepted from input ($100,000,000,000.00). Keeps sums of many
// items well inside int64 and exactly representable as double.
constexpr Cents kMaxCents = 10000000000000;

// Nearest cent, halves rounded away from zero. Throws std::runtime_error when
// |dollars| exceeds kMaxCents.
Cents to_cents(double dollars);

double to_dollars(Cents cents);

// a / n rounded to the nearest cent (half away from zero). n must be > 0.
Cents divide_rounded(Cents amount, std::int64_t n);

// Parses "12", "12.5", "-0.01", "$1,234.56". Throws std::runtime_error on anything else
// on more than two fractional digits, or beyond kMaxCents.
Cents parse_amount(const std::string& s);

// "1234.56" / "-0.01"
std::string format_amount(Cents cents);

// "$1234.56" / "-$0.01"
std::string format_currency(Cents cents);

}  // namespace splitlens
