#pragma once

#include <string>
#include <variant>

#include "matrix.hh"

namespace deltae
{
  // Standard illuminant white points (2 degree observer), Y normalized to 1.
  // See http://www.brucelindbloom.com/index.html?Eqn_ChromAdapt.html
  namespace white_point
  {
    // Tungsten-filament (incandescent)
    inline constexpr Matrix3x1 A{1.09850, 1.00000, 0.35585};
    // Daylight simulation at noon (4874K)
    inline constexpr Matrix3x1 B{0.99072, 1.00000, 0.85223};
    // Daylight simulation average (6774K)
    inline constexpr Matrix3x1 C{0.98074, 1.00000, 1.18232};
    inline constexpr Matrix3x1 D50{0.96422, 1.00000, 0.82521};
    inline constexpr Matrix3x1 D55{0.95682, 1.00000, 0.92149};
    inline constexpr Matrix3x1 D65{0.95047, 1.00000, 1.08883};
    inline constexpr Matrix3x1 D75{0.94972, 1.00000, 1.22638};
    // Equal energy radiator
    inline constexpr Matrix3x1 E{1.00000, 1.00000, 1.00000};
    // Fluorescent: standard, broadband, narrowband
    inline constexpr Matrix3x1 F2{0.99186, 1.00000, 0.67393};
    inline constexpr Matrix3x1 F7{0.95041, 1.00000, 1.08747};
    inline constexpr Matrix3x1 F11{1.00962, 1.00000, 0.64350};
  } // namespace white_point

  enum class StandardIlluminant
  {
    A,
    B,
    C,
    D50,
    D55,
    D65,
    D75,
    E,
    F2,
    F7,
    F11
  };

  /*
   * Reference light source. Either one of the standard illuminants or an
   * arbitrary white point. Two illuminants are equal when their white
   * points are equal, whatever the variant.
   */
  class Illuminant
  {
  public:
    constexpr Illuminant(StandardIlluminant standard = StandardIlluminant::D50)
      : value_(standard)
    {}

    static Illuminant other(double x, double y, double z);

    Matrix3x1 whitePoint() const;
    bool isStandard() const;
    std::string name() const;

    bool operator==(const Illuminant& rhs) const;

  private:
    explicit Illuminant(const Matrix3x1& white)
      : value_(white)
    {}

    std::variant<StandardIlluminant, Matrix3x1> value_;
  };

  Matrix3x1 whitePoint(StandardIlluminant illuminant);
} // namespace deltae
