#pragma once

#include "color_values.hh"
#include "illuminant.hh"
#include "matrix.hh"

namespace deltae
{
  enum class AdaptationMethod
  {
    XyzScaling,
    Bradford,
    VonKries
  };

  // Cone response domain matrices, and their inverses
  // http://www.brucelindbloom.com/index.html?Eqn_ChromAdapt.html
  inline constexpr Matrix3x3 XYZ_SCALING = Matrix3x3::identity();

  inline constexpr Matrix3x3 BRADFORD{0.8951000, 0.2664000, -0.1614000,
                                      -0.7502000, 1.7135000, 0.0367000,
                                      0.0389000, -0.0685000, 1.0296000};
  inline constexpr Matrix3x3 BRADFORD_INV{0.9869929, -0.1470543, 0.1599627,
                                          0.4323053, 0.5183603, 0.0492912,
                                          -0.0085287, 0.0400428, 0.9684867};

  inline constexpr Matrix3x3 VON_KRIES{0.4002400, 0.7076000, -0.0808100,
                                       -0.2263000, 1.1653200, 0.0457000,
                                       0.0000000, 0.0000000, 0.9182200};
  inline constexpr Matrix3x3 VON_KRIES_INV{1.8599364, -1.1293816, 0.2198974,
                                           0.3611914, 0.6388125, -0.0000064,
                                           0.0000000, 0.0000000, 1.0890636};

  Matrix3x3 coneResponseMatrix(AdaptationMethod method);
  Matrix3x3 coneResponseMatrixInverse(AdaptationMethod method);

  // (rho, gamma, beta) of an illuminant's white point
  Matrix3x1 coneResponse(const Illuminant& illuminant, AdaptationMethod method);

  /*
   * Combined transform M^-1 * diag(dst / src) * M mapping XYZ relative to
   * `source` onto XYZ relative to `destination`.
   * Throws InvalidInput when a white point has a zero or non-finite
   * component, or the source cone response has a zero component.
   */
  Matrix3x3 adaptationMatrix(const Illuminant& source,
                             const Illuminant& destination,
                             AdaptationMethod method);

  // Returns `xyz` untouched when `source` and `destination` are equal
  Matrix3x1 chromaticAdapt(const Matrix3x1& xyz,
                           const Illuminant& source,
                           const Illuminant& destination,
                           AdaptationMethod method = AdaptationMethod::Bradford);

  // The source illuminant is the one `xyz` is relative to
  XyzValue chromaticAdapt(const XyzValue& xyz,
                          const Illuminant& destination,
                          AdaptationMethod method = AdaptationMethod::Bradford);
} // namespace deltae
