// Implementation of exact rational arithmetic.

#include "core/fraction.h"

namespace engrave {

int64_t gcd64(int64_t lhs, int64_t rhs) {
  lhs = lhs < 0 ? -lhs : lhs;
  rhs = rhs < 0 ? -rhs : rhs;
  while (rhs != 0) {
    int64_t rem = lhs % rhs;
    lhs = rhs;
    rhs = rem;
  }
  return lhs;
}

Fraction::Fraction(int64_t num, int64_t den) {
  if (den == 0) return;  // stays 0/1
  if (den < 0) {
    num = -num;
    den = -den;
  }
  int64_t divisor = gcd64(num, den);
  if (divisor == 0) divisor = 1;
  num_ = num / divisor;
  den_ = den / divisor;
}

std::string Fraction::toString() const {
  return std::to_string(num_) + "/" + std::to_string(den_);
}

Fraction Fraction::operator+(const Fraction& other) const {
  // Work over the lcm to keep intermediate values small.
  int64_t divisor = gcd64(den_, other.den_);
  int64_t lcm = (den_ / divisor) * other.den_;
  return Fraction(num_ * (lcm / den_) + other.num_ * (lcm / other.den_), lcm);
}

Fraction Fraction::operator-(const Fraction& other) const {
  return *this + Fraction(-other.num_, other.den_);
}

Fraction Fraction::operator*(const Fraction& other) const {
  // Cross-reduce before multiplying.
  int64_t g1 = gcd64(num_, other.den_);
  int64_t g2 = gcd64(other.num_, den_);
  if (g1 == 0) g1 = 1;
  if (g2 == 0) g2 = 1;
  return Fraction((num_ / g1) * (other.num_ / g2), (den_ / g2) * (other.den_ / g1));
}

Fraction& Fraction::operator+=(const Fraction& other) {
  *this = *this + other;
  return *this;
}

bool Fraction::operator<(const Fraction& other) const {
  // Denominators are positive, so cross multiplication keeps the order.
  return num_ * other.den_ < other.num_ * den_;
}

}  // namespace engrave
