#pragma once

#include <cstdint>

#include "illuminant.hh"

namespace deltae
{
  namespace detail
  {
    // Tag for the library's own conversions, which build values without
    // range validation
    struct unchecked_t
    {
      explicit unchecked_t() = default;
    };
    inline constexpr unchecked_t unchecked{};
  } // namespace detail

  // sqrt(128^2 + 128^2)
  constexpr double LCH_MAX_CHROMA = 181.01933598375618;

  /*
   * CIE L*a*b*
   *
   *   L*  light <-> dark        0 .. 100
   *   a*  green <-> magenta  -128 .. 128
   *   b*  blue  <-> yellow   -128 .. 128
   */
  class LabValue
  {
  public:
    LabValue() = default;
    // Throws OutOfBounds
    LabValue(double l, double a, double b);
    LabValue(double l, double a, double b, detail::unchecked_t) noexcept
      : l_(l)
      , a_(a)
      , b_(b)
    {}

    double l() const { return l_; }
    double a() const { return a_; }
    double b() const { return b_; }

    bool operator==(const LabValue&) const = default;

  private:
    double l_ = 0.0;
    double a_ = 0.0;
    double b_ = 0.0;
  };

  /*
   * Lightness, chroma, hue: polar form of Lab
   *
   *   L*  light <-> dark   0 .. 100
   *   c   chroma           0 .. 181.0193
   *   h   hue (degrees)    0 .. 360
   */
  class LchValue
  {
  public:
    LchValue() = default;
    // Throws OutOfBounds
    LchValue(double l, double c, double h);
    LchValue(double l, double c, double h, detail::unchecked_t) noexcept
      : l_(l)
      , c_(c)
      , h_(h)
    {}

    double l() const { return l_; }
    double c() const { return c_; }
    double h() const { return h_; }
    double hueRadians() const;

    bool operator==(const LchValue&) const = default;

  private:
    double l_ = 0.0;
    double c_ = 0.0;
    double h_ = 0.0;
  };

  /*
   * CIE XYZ tristimulus values, scaled to the white point of the reference
   * illuminant they are relative to (Y of the white point is 1). Values are
   * unbounded above; validation only rejects negative and non-finite input.
   */
  class XyzValue
  {
  public:
    XyzValue() = default;
    // Throws OutOfBounds
    XyzValue(double x, double y, double z, Illuminant illuminant = Illuminant());
    XyzValue(double x,
             double y,
             double z,
             Illuminant illuminant,
             detail::unchecked_t) noexcept
      : x_(x)
      , y_(y)
      , z_(z)
      , illuminant_(illuminant)
    {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }
    const Illuminant& illuminant() const { return illuminant_; }
    Matrix3x1 vector() const { return {x_, y_, z_}; }

    bool operator==(const XyzValue&) const = default;

  private:
    double x_ = 0.0;
    double y_ = 0.0;
    double z_ = 0.0;
    Illuminant illuminant_;
  };

  class RgbNominalValue;

  // 8-bit device RGB, 0 .. 255 per channel
  struct RgbValue
  {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    RgbValue invert() const;
    RgbNominalValue nominalize() const;

    bool operator==(const RgbValue&) const = default;
  };

  // RGB on a 0 .. 1 scale. Channels are clamped on construction.
  class RgbNominalValue
  {
  public:
    RgbNominalValue() = default;
    RgbNominalValue(double r, double g, double b);

    double r() const { return r_; }
    double g() const { return g_; }
    double b() const { return b_; }

    RgbValue denominalize() const;

    bool operator==(const RgbNominalValue&) const = default;

  private:
    double r_ = 0.0;
    double g_ = 0.0;
    double b_ = 0.0;
  };
} // namespace deltae
