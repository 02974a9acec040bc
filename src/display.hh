#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "color_values.hh"
#include "delta_e.hh"
#include "rgb_system.hh"

namespace deltae
{
  /*
   * Text rendering. Without a precision numbers use their shortest round
   * trip form ("1", "5.316938317938254"); with one they are printed with that
   * many fixed digits after the decimal point.
   *
   *   LabValue  [L:89.73, a:1.88, b:-6.96]
   *   LchValue  [L:89.73, c:7.2094, h:285.1157]
   *   XyzValue  [X:0.84576, Y:0.87808, Z:1.03532]
   *   RgbValue  [R:64, G:128, B:192]
   *   RgbSystem Adobe RGB (1998)
   *   DEMethod  DE2000 | DE1976 | DE1994 | DE1994T | DECMC(1:1)
   *   DeltaE    5.3169 DE2000
   */
  using precision_t = std::optional<int>;

  std::string formatNumber(double value, precision_t precision = std::nullopt);

  std::string toString(const LabValue& lab, precision_t precision = std::nullopt);
  std::string toString(const LchValue& lch, precision_t precision = std::nullopt);
  std::string toString(const XyzValue& xyz, precision_t precision = std::nullopt);
  std::string toString(const RgbValue& rgb);
  std::string toString(RgbSystem system);
  // "[R:64, G:128, B:192] Adobe RGB (1998)"
  std::string toString(const RgbSystemValue& rgb);
  std::string toString(const RgbNominalValue& rgb, precision_t precision = std::nullopt);
  std::string toString(const DEMethod& method, precision_t precision = std::nullopt);
  std::string toString(const DeltaE& delta, precision_t precision = std::nullopt);

  std::ostream& operator<<(std::ostream& os, const LabValue& lab);
  std::ostream& operator<<(std::ostream& os, const LchValue& lch);
  std::ostream& operator<<(std::ostream& os, const XyzValue& xyz);
  std::ostream& operator<<(std::ostream& os, const RgbValue& rgb);
  std::ostream& operator<<(std::ostream& os, RgbSystem system);
  std::ostream& operator<<(std::ostream& os, const RgbSystemValue& rgb);
  std::ostream& operator<<(std::ostream& os, const RgbNominalValue& rgb);
  std::ostream& operator<<(std::ostream& os, const DEMethod& method);
  std::ostream& operator<<(std::ostream& os, const DeltaE& delta);
} // namespace deltae
