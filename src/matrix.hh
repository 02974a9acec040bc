#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>

namespace deltae
{
  /*
   * Column vector of 3 values
   */
  struct Matrix3x1
  {
    std::array<double, 3> inner = {0.0, 0.0, 0.0};

    constexpr Matrix3x1() = default;
    constexpr Matrix3x1(double x, double y, double z)
      : inner{x, y, z}
    {}

    constexpr double operator[](std::size_t idx) const
    {
      if (idx > 2)
        throw std::out_of_range("Matrix3x1 index out of bounds");
      return inner[idx];
    }

    constexpr double x() const { return inner[0]; }
    constexpr double y() const { return inner[1]; }
    constexpr double z() const { return inner[2]; }

    Matrix3x1 pow(double exponent) const;

    constexpr bool operator==(const Matrix3x1&) const = default;
  };

  /*
   * Row-major 3x3 matrix. Entry (column, row) is stored at row * 3 + column,
   * so a matrix applied to a vector computes the dot product of each row
   * with it. Every constant table in the library is written this way.
   */
  struct Matrix3x3
  {
    std::array<double, 9> inner = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};

    constexpr Matrix3x3() = default;
    constexpr Matrix3x3(double x0, double y0, double z0,
                        double x1, double y1, double z1,
                        double x2, double y2, double z2)
      : inner{x0, y0, z0, x1, y1, z1, x2, y2, z2}
    {}

    static constexpr Matrix3x3 identity()
    {
      return {1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    }

    static constexpr Matrix3x3 diagonal(const Matrix3x1& v)
    {
      return {v.x(), 0.0, 0.0, 0.0, v.y(), 0.0, 0.0, 0.0, v.z()};
    }

    constexpr double operator[](std::size_t idx) const
    {
      if (idx > 8)
        throw std::out_of_range("Matrix3x3 index out of bounds: the len is 9");
      return inner[idx];
    }

    constexpr double operator()(std::size_t column, std::size_t row) const
    {
      if (column > 2)
        throw std::out_of_range("Matrix3x3 index out of bounds: the width is 3");
      if (row > 2)
        throw std::out_of_range("Matrix3x3 index out of bounds: the height is 3");
      return inner[row * 3 + column];
    }

    // Raise every entry to `exponent`
    Matrix3x3 pow(double exponent) const;

    // Primary columns of an RGB -> XYZ matrix
    Matrix3x1 xyzRed() const;
    Matrix3x1 xyzGreen() const;
    Matrix3x1 xyzBlue() const;

    constexpr bool operator==(const Matrix3x3&) const = default;
  };

  constexpr Matrix3x3 operator*(const Matrix3x3& lhs, const Matrix3x3& rhs)
  {
    Matrix3x3 out;
    for (std::size_t row = 0; row < 3; ++row)
      {
        for (std::size_t col = 0; col < 3; ++col)
          {
            double sum = 0.0;
            for (std::size_t kk = 0; kk < 3; ++kk)
              sum += lhs.inner[row * 3 + kk] * rhs.inner[kk * 3 + col];
            out.inner[row * 3 + col] = sum;
          }
      }
    return out;
  }

  constexpr Matrix3x1 operator*(const Matrix3x3& lhs, const Matrix3x1& rhs)
  {
    const auto& m = lhs.inner;
    const auto& v = rhs.inner;
    return {m[0] * v[0] + m[1] * v[1] + m[2] * v[2],
            m[3] * v[0] + m[4] * v[1] + m[5] * v[2],
            m[6] * v[0] + m[7] * v[1] + m[8] * v[2]};
  }
} // namespace deltae
