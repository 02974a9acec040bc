#include "display.hh"

#include <charconv>
#include <string>

namespace deltae
{
  std::string formatNumber(double value, precision_t precision)
  {
    char buffer[128];
    std::to_chars_result result;
    if (precision)
      result = std::to_chars(buffer,
                             buffer + sizeof(buffer),
                             value,
                             std::chars_format::fixed,
                             *precision);
    else
      result = std::to_chars(buffer, buffer + sizeof(buffer), value);

    if (result.ec != std::errc())
      return "?";
    return std::string(buffer, result.ptr);
  }

  static std::string triple(char n0, double v0,
                            char n1, double v1,
                            char n2, double v2,
                            precision_t precision)
  {
    std::string out = "[";
    out += n0;
    out += ":" + formatNumber(v0, precision) + ", ";
    out += n1;
    out += ":" + formatNumber(v1, precision) + ", ";
    out += n2;
    out += ":" + formatNumber(v2, precision) + "]";
    return out;
  }

  std::string toString(const LabValue& lab, precision_t precision)
  {
    return triple('L', lab.l(), 'a', lab.a(), 'b', lab.b(), precision);
  }

  std::string toString(const LchValue& lch, precision_t precision)
  {
    return triple('L', lch.l(), 'c', lch.c(), 'h', lch.h(), precision);
  }

  std::string toString(const XyzValue& xyz, precision_t precision)
  {
    return triple('X', xyz.x(), 'Y', xyz.y(), 'Z', xyz.z(), precision);
  }

  std::string toString(const RgbValue& rgb)
  {
    return "[R:" + std::to_string(rgb.r) + ", G:" + std::to_string(rgb.g)
      + ", B:" + std::to_string(rgb.b) + "]";
  }

  std::string toString(RgbSystem system)
  {
    return rgbSystemInfo(system).name;
  }

  std::string toString(const RgbSystemValue& rgb)
  {
    return toString(rgb.value) + " " + toString(rgb.system);
  }

  std::string toString(const RgbNominalValue& rgb, precision_t precision)
  {
    return triple('R', rgb.r(), 'G', rgb.g(), 'B', rgb.b(), precision);
  }

  std::string toString(const DEMethod& method, precision_t precision)
  {
    if (std::holds_alternative<DE2000>(method))
      return "DE2000";
    if (std::holds_alternative<DE1976>(method))
      return "DE1976";
    if (const auto* de94 = std::get_if<DE1994>(&method))
      return de94->textile ? "DE1994T" : "DE1994";

    const DECMC& cmc = std::get<DECMC>(method);
    return "DECMC(" + formatNumber(cmc.tolerance_l, precision) + ":"
      + formatNumber(cmc.tolerance_c, precision) + ")";
  }

  std::string toString(const DeltaE& delta, precision_t precision)
  {
    return formatNumber(delta.value(), precision) + " "
      + toString(delta.method(), precision);
  }

  std::ostream& operator<<(std::ostream& os, const LabValue& lab)
  {
    return os << toString(lab);
  }

  std::ostream& operator<<(std::ostream& os, const LchValue& lch)
  {
    return os << toString(lch);
  }

  std::ostream& operator<<(std::ostream& os, const XyzValue& xyz)
  {
    return os << toString(xyz);
  }

  std::ostream& operator<<(std::ostream& os, const RgbValue& rgb)
  {
    return os << toString(rgb);
  }

  std::ostream& operator<<(std::ostream& os, RgbSystem system)
  {
    return os << toString(system);
  }

  std::ostream& operator<<(std::ostream& os, const RgbSystemValue& rgb)
  {
    return os << toString(rgb);
  }

  std::ostream& operator<<(std::ostream& os, const RgbNominalValue& rgb)
  {
    return os << toString(rgb);
  }

  std::ostream& operator<<(std::ostream& os, const DEMethod& method)
  {
    return os << toString(method);
  }

  std::ostream& operator<<(std::ostream& os, const DeltaE& delta)
  {
    return os << toString(delta);
  }
} // namespace deltae
