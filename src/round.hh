#pragma once

#include "color_values.hh"
#include "delta_e.hh"

namespace deltae
{
  // Round half away from zero to `places` decimals
  double roundTo(double value, int places);

  DeltaE roundTo(const DeltaE& delta, int places);
  LabValue roundTo(const LabValue& lab, int places);
  LchValue roundTo(const LchValue& lch, int places);
  XyzValue roundTo(const XyzValue& xyz, int places);
} // namespace deltae
