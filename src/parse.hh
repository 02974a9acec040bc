#pragma once

#include <string_view>

#include "color_values.hh"
#include "delta_e.hh"
#include "illuminant.hh"

namespace deltae
{
  /*
   * Parse "v0, v1, v2" (comma separated, whitespace tolerated) into a color.
   * Throws BadFormat on a wrong token count or a non-numeric token, and
   * OutOfBounds when the numbers do not fit the color's range.
   */
  LabValue parseLab(std::string_view text);
  LchValue parseLch(std::string_view text);
  XyzValue parseXyz(std::string_view text, const Illuminant& illuminant = Illuminant());
  RgbValue parseRgb(std::string_view text);

  // More digits than a double carries are noise
  constexpr int MAX_PRECISION = 17;

  // Digits after the decimal point for display, 0 .. MAX_PRECISION.
  // Throws BadFormat otherwise.
  int parsePrecision(std::string_view text);

  // Case insensitive aliases ("de2000", "94t", "cmc2", ...).
  // Throws InvalidInput for unknown names.
  DEMethod parseMethod(std::string_view text);
} // namespace deltae
