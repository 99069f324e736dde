// Exact rational arithmetic for note durations.

#ifndef ENGRAVE_CORE_FRACTION_H
#define ENGRAVE_CORE_FRACTION_H

#include <cstdint>
#include <string>

namespace engrave {

/// @brief Rational number over a whole note (1/4 = quarter note).
///
/// Always stored normalized: numerator and denominator are coprime and the
/// denominator is positive. Beat sums compare with exact equality, so
/// durations never pass through floating point.
class Fraction {
 public:
  /// @brief Zero (0/1).
  constexpr Fraction() = default;

  /// @brief Construct and normalize num/den. A zero denominator yields 0/1.
  Fraction(int64_t num, int64_t den);

  int64_t num() const { return num_; }
  int64_t den() const { return den_; }

  bool isZero() const { return num_ == 0; }

  /// @brief Approximate value, for width weighting only.
  double toDouble() const {
    return static_cast<double>(num_) / static_cast<double>(den_);
  }

  /// @brief Format as "num/den" (e.g. "3/4", "1/1").
  std::string toString() const;

  Fraction operator+(const Fraction& other) const;
  Fraction operator-(const Fraction& other) const;
  Fraction operator*(const Fraction& other) const;
  Fraction& operator+=(const Fraction& other);

  bool operator==(const Fraction& other) const {
    return num_ == other.num_ && den_ == other.den_;
  }
  bool operator!=(const Fraction& other) const { return !(*this == other); }
  bool operator<(const Fraction& other) const;
  bool operator<=(const Fraction& other) const { return !(other < *this); }
  bool operator>(const Fraction& other) const { return other < *this; }
  bool operator>=(const Fraction& other) const { return !(*this < other); }

 private:
  int64_t num_ = 0;
  int64_t den_ = 1;
};

/// @brief Greatest common divisor of |lhs| and |rhs| (gcd(0, 0) == 0).
int64_t gcd64(int64_t lhs, int64_t rhs);

}  // namespace engrave

#endif  // ENGRAVE_CORE_FRACTION_H
