#include "round.hh"

#include <cmath>

namespace deltae
{
  double roundTo(double value, int places)
  {
    const double mult = std::pow(10.0, places);
    return std::round(value * mult) / mult;
  }

  DeltaE roundTo(const DeltaE& delta, int places)
  {
    return DeltaE(delta.method(), roundTo(delta.value(), places));
  }

  LabValue roundTo(const LabValue& lab, int places)
  {
    return LabValue(roundTo(lab.l(), places),
                    roundTo(lab.a(), places),
                    roundTo(lab.b(), places),
                    detail::unchecked);
  }

  LchValue roundTo(const LchValue& lch, int places)
  {
    return LchValue(roundTo(lch.l(), places),
                    roundTo(lch.c(), places),
                    roundTo(lch.h(), places),
                    detail::unchecked);
  }

  XyzValue roundTo(const XyzValue& xyz, int places)
  {
    return XyzValue(roundTo(xyz.x(), places),
                    roundTo(xyz.y(), places),
                    roundTo(xyz.z(), places),
                    xyz.illuminant(),
                    detail::unchecked);
  }
} // namespace deltae
