#include "matrix.hh"

#include <cmath>

namespace deltae
{
  Matrix3x1 Matrix3x1::pow(double exponent) const
  {
    return {std::pow(inner[0], exponent),
            std::pow(inner[1], exponent),
            std::pow(inner[2], exponent)};
  }

  Matrix3x3 Matrix3x3::pow(double exponent) const
  {
    // std::pow yields NaN for a negative base with a non-integer exponent
    Matrix3x3 out;
    for (std::size_t ii = 0; ii < inner.size(); ++ii)
      out.inner[ii] = std::pow(inner[ii], exponent);
    return out;
  }

  Matrix3x1 Matrix3x3::xyzRed() const
  {
    return {(*this)(0, 0), (*this)(0, 1), (*this)(0, 2)};
  }

  Matrix3x1 Matrix3x3::xyzGreen() const
  {
    return {(*this)(1, 0), (*this)(1, 1), (*this)(1, 2)};
  }

  Matrix3x1 Matrix3x3::xyzBlue() const
  {
    return {(*this)(2, 0), (*this)(2, 1), (*this)(2, 2)};
  }
} // namespace deltae
