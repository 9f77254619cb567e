#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <string>

namespace coffer {

    /// Fixed-point monetary amount with 4 fractional digits.
    /// Stored as a count of 1/10000 units so sums stay exact.
    class Amount {
      public:
        static constexpr int kScale = 4;
        static constexpr int64_t kUnitsPerWhole = 10000;
        /// 99,999,999,999,999.9999. Also the lifetime volume of one asset: the
        /// journal refuses entries past it, so every wallet total, balance and
        /// per-asset sum fits in int64.
        static constexpr int64_t kMaxUnits = 999'999'999'999'999'999;

        constexpr Amount() : units_(0) {}

        static constexpr Amount fromUnits(int64_t units) { return Amount(units); }

        static Amount fromWhole(int64_t whole) { return Amount(whole * kUnitsPerWhole); }

        /// Parse a decimal string ("500", "12.5", "-0.0001").
        /// Digits beyond the 4th fractional place are rounded half away from zero.
        static dp::Result<Amount, dp::Error> parse(const std::string &text);

        /// Quantize a binary floating point value to 4 fractional digits.
        static dp::Result<Amount, dp::Error> fromDouble(double value);

        int64_t units() const { return units_; }

        bool isPositive() const { return units_ > 0; }
        bool isZero() const { return units_ == 0; }
        bool isNegative() const { return units_ < 0; }

        /// Always renders exactly 4 fractional digits, e.g. "0.0000", "-12.3400"
        std::string toString() const;

        /// Shortest exact rendering: "500", "12.5", "0.0001"
        std::string toCompactString() const;

        Amount operator+(const Amount &other) const { return Amount(units_ + other.units_); }
        Amount operator-(const Amount &other) const { return Amount(units_ - other.units_); }
        Amount operator-() const { return Amount(-units_); }
        Amount &operator+=(const Amount &other) {
            units_ += other.units_;
            return *this;
        }
        Amount &operator-=(const Amount &other) {
            units_ -= other.units_;
            return *this;
        }

        bool operator==(const Amount &other) const { return units_ == other.units_; }
        bool operator!=(const Amount &other) const { return units_ != other.units_; }
        bool operator<(const Amount &other) const { return units_ < other.units_; }
        bool operator<=(const Amount &other) const { return units_ <= other.units_; }
        bool operator>(const Amount &other) const { return units_ > other.units_; }
        bool operator>=(const Amount &other) const { return units_ >= other.units_; }

      private:
        explicit constexpr Amount(int64_t units) : units_(units) {}

        int64_t units_;
    };

} // namespace coffer
