#include "color_values.hh"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <numbers>

#include "display.hh"
#include "value_error.hh"

namespace deltae
{
  // NaN fails every comparison, so ranges are checked in the positive form
  static bool inRange(double value, double low, double high)
  {
    return value >= low && value <= high;
  }

  LabValue::LabValue(double l, double a, double b)
    : l_(l)
    , a_(a)
    , b_(b)
  {
    if (!inRange(l, 0.0, 100.0) || !inRange(a, -128.0, 128.0)
        || !inRange(b, -128.0, 128.0))
      throw OutOfBounds(toString(*this));
  }

  LchValue::LchValue(double l, double c, double h)
    : l_(l)
    , c_(c)
    , h_(h)
  {
    if (!inRange(l, 0.0, 100.0) || !inRange(c, 0.0, LCH_MAX_CHROMA)
        || !inRange(h, 0.0, 360.0))
      throw OutOfBounds(toString(*this));
  }

  double LchValue::hueRadians() const
  {
    return h_ * std::numbers::pi / 180.0;
  }

  XyzValue::XyzValue(double x, double y, double z, Illuminant illuminant)
    : x_(x)
    , y_(y)
    , z_(z)
    , illuminant_(illuminant)
  {
    for (double v : {x, y, z})
      if (!std::isfinite(v) || v < 0.0)
        throw OutOfBounds(toString(*this));
  }

  RgbValue RgbValue::invert() const
  {
    return RgbValue{static_cast<std::uint8_t>(255 - r),
                    static_cast<std::uint8_t>(255 - g),
                    static_cast<std::uint8_t>(255 - b)};
  }

  RgbNominalValue RgbValue::nominalize() const
  {
    return RgbNominalValue(r / 255.0, g / 255.0, b / 255.0);
  }

  static double clampUnit(double value)
  {
    // NaN from a degenerate matrix product maps to black
    if (std::isnan(value))
      return 0.0;
    return std::clamp(value, 0.0, 1.0);
  }

  RgbNominalValue::RgbNominalValue(double r, double g, double b)
    : r_(clampUnit(r))
    , g_(clampUnit(g))
    , b_(clampUnit(b))
  {}

  static std::uint8_t denominalizeChannel(double value)
  {
    return static_cast<std::uint8_t>(std::lround(value * 255.0));
  }

  RgbValue RgbNominalValue::denominalize() const
  {
    return RgbValue{denominalizeChannel(r_),
                    denominalizeChannel(g_),
                    denominalizeChannel(b_)};
  }
} // namespace deltae
