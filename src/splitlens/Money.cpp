#include "splitlens/Money.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace splitlens {

Cents to_cents(double dollars) {
    if (!std::isfinite(dollars)) throw std::runtime_error("amount is not a finite number");
    if (std::fabs(dollars) > static_cast<double>(kMaxCents) / 100.0) {
        throw std::runtime_error("amount out of range");
    }
    return static_cast<Cents>(std::llround(dollars * 100.0));
}

double to_dollars(Cents cents) {
    return static_cast<double>(cents) / 100.0;
}

Cents divide_rounded(Cents amount, std::int64_t n) {
    if (n <= 0) throw std::invalid_argument("divide_rounded: divisor must be positive");
    const Cents mag = amount < 0 ? -amount : amount;
    const Cents q = (mag * 2 + n) / (n * 2);
    return amount < 0 ? -q : q;
}

Cents parse_amount(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;

    bool negative = false;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        negative = (s[i] == '-');
        ++i;
    }
    if (i < s.size() && s[i] == '$') ++i;

    Cents whole = 0;
    int int_digits = 0;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (c == ',') continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        whole = whole * 10 + (c - '0');
        ++int_digits;
        if (whole > kMaxCents / 100) throw std::runtime_error("amount out of range: " + s);
    }

    Cents frac = 0;
    int frac_digits = 0;
    if (i < s.size() && s[i] == '.') {
        ++i;
        for (; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
            if (frac_digits == 2) throw std::runtime_error("amount has more than two decimal places: " + s);
            frac = frac * 10 + (s[i] - '0');
            ++frac_digits;
        }
    }
    if (frac_digits == 1) frac *= 10;

    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i != s.size() || (int_digits == 0 && frac_digits == 0)) {
        throw std::runtime_error("invalid amount: " + s);
    }

    const Cents total = whole * 100 + frac;
    if (total > kMaxCents) throw std::runtime_error("amount out of range: " + s);
    return negative ? -total : total;
}

std::string format_amount(Cents cents) {
    const bool negative = cents < 0;
    const Cents mag = negative ? -cents : cents;

    std::string frac = std::to_string(mag % 100);
    if (frac.size() < 2) frac.insert(0, 1, '0');

    std::string out = negative ? "-" : "";
    out += std::to_string(mag / 100);
    out += ".";
    out += frac;
    return out;
}

std::string format_currency(Cents cents) {
    if (cents < 0) return "-$" + format_amount(-cents);
    return "$" + format_amount(cents);
}

}  // namespace splitlens
