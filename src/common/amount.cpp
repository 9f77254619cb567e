#include <coffer/common/amount.hpp>
#include <coffer/common/error.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace coffer {

    dp::Result<Amount, dp::Error> Amount::parse(const std::string &text) {
        if (text.empty()) {
            return dp::Result<Amount, dp::Error>::err(validation_error("Amount is empty"));
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '+' || text[pos] == '-') {
            negative = (text[pos] == '-');
            ++pos;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fraction_digits = 0;
        bool round_up = false;
        bool seen_digit = false;
        bool seen_point = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seen_point) {
                    return dp::Result<Amount, dp::Error>::err(validation_error("Malformed amount: " + text));
                }
                seen_point = true;
                continue;
            }
            if (c < '0' || c > '9') {
                return dp::Result<Amount, dp::Error>::err(validation_error("Malformed amount: " + text));
            }
            seen_digit = true;
            int digit = c - '0';

            if (!seen_point) {
                if (whole > (kMaxUnits / kUnitsPerWhole - digit) / 10) {
                    return dp::Result<Amount, dp::Error>::err(validation_error("Amount out of range: " + text));
                }
                whole = whole * 10 + digit;
            } else if (fraction_digits < kScale) {
                fraction = fraction * 10 + digit;
                ++fraction_digits;
            } else if (fraction_digits == kScale) {
                // first dropped digit decides the rounding
                round_up = digit >= 5;
                ++fraction_digits;
            }
        }

        if (!seen_digit) {
            return dp::Result<Amount, dp::Error>::err(validation_error("Malformed amount: " + text));
        }

        for (int i = std::min(fraction_digits, kScale); i < kScale; ++i) {
            fraction *= 10;
        }

        int64_t units = whole * kUnitsPerWhole + fraction + (round_up ? 1 : 0);
        if (units > kMaxUnits) {
            return dp::Result<Amount, dp::Error>::err(validation_error("Amount out of range: " + text));
        }

        return dp::Result<Amount, dp::Error>::ok(Amount(negative ? -units : units));
    }

    dp::Result<Amount, dp::Error> Amount::fromDouble(double value) {
        if (!std::isfinite(value)) {
            return dp::Result<Amount, dp::Error>::err(validation_error("Amount must be a finite number"));
        }
        double scaled = value * static_cast<double>(kUnitsPerWhole);
        if (std::fabs(scaled) > static_cast<double>(kMaxUnits)) {
            return dp::Result<Amount, dp::Error>::err(validation_error("Amount out of range"));
        }
        return dp::Result<Amount, dp::Error>::ok(Amount(static_cast<int64_t>(std::llround(scaled))));
    }

    std::string Amount::toString() const {
        // units_ never exceeds kMaxUnits in magnitude, so negation is safe
        int64_t magnitude = units_ < 0 ? -units_ : units_;
        std::string fraction = std::to_string(magnitude % kUnitsPerWhole);
        while (fraction.size() < static_cast<size_t>(kScale)) {
            fraction.insert(fraction.begin(), '0');
        }
        std::string out = units_ < 0 ? "-" : "";
        out += std::to_string(magnitude / kUnitsPerWhole);
        out += '.';
        out += fraction;
        return out;
    }

    std::string Amount::toCompactString() const {
        std::string out = toString();
        while (out.back() == '0') {
            out.pop_back();
        }
        if (out.back() == '.') {
            out.pop_back();
        }
        return out;
    }

} // namespace coffer
