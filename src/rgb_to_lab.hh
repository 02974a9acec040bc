#pragma once

#include "chromatic_adaptation.hh"
#include "color_values.hh"
#include "illuminant.hh"
#include "rgb_system.hh"

namespace deltae
{
  /*
   * Parameters of the conversion into the common comparable form
   */
  struct conversion_params
  {
    // White point the comparable Lab values are relative to
    Illuminant reference = StandardIlluminant::D50;
    // Working space assumed for a bare RgbValue
    RgbSystem rgb_system = RgbSystem::SRgb;
    AdaptationMethod adaptation = AdaptationMethod::Bradford;
  };

  // atan2(b, a) in degrees, shifted into [0, 360)
  double hueAngle(double a, double b);

  LchValue labToLch(const LabValue& lab);
  LabValue lchToLab(const LchValue& lch);

  // Lab relative to the white point of the illuminant `xyz` carries
  LabValue xyzToLab(const XyzValue& xyz);
  XyzValue labToXyz(const LabValue& lab, const Illuminant& illuminant = Illuminant());

  LchValue xyzToLch(const XyzValue& xyz);
  XyzValue lchToXyz(const LchValue& lch, const Illuminant& illuminant = Illuminant());

  // Result is relative to the system's own illuminant
  XyzValue rgbToXyz(const RgbValue& rgb, RgbSystem system = RgbSystem::SRgb);
  // Gamut clamps, never fails
  RgbValue xyzToRgb(const XyzValue& xyz,
                    RgbSystem system = RgbSystem::SRgb,
                    AdaptationMethod method = AdaptationMethod::Bradford);

  LabValue rgbToLab(const RgbValue& rgb,
                    RgbSystem system = RgbSystem::SRgb,
                    const Illuminant& illuminant = Illuminant(),
                    AdaptationMethod method = AdaptationMethod::Bradford);
  RgbValue labToRgb(const LabValue& lab,
                    RgbSystem system = RgbSystem::SRgb,
                    const Illuminant& illuminant = Illuminant(),
                    AdaptationMethod method = AdaptationMethod::Bradford);

  LchValue rgbToLch(const RgbValue& rgb, RgbSystem system = RgbSystem::SRgb);
  RgbValue lchToRgb(const LchValue& lch, RgbSystem system = RgbSystem::SRgb);

  // Common comparable representation used by the Delta E engine
  LabValue toLab(const LabValue& lab, const conversion_params& params = {});
  LabValue toLab(const LchValue& lch, const conversion_params& params = {});
  LabValue toLab(const XyzValue& xyz, const conversion_params& params = {});
  LabValue toLab(const RgbValue& rgb, const conversion_params& params = {});
  LabValue toLab(const RgbSystemValue& rgb, const conversion_params& params = {});
} // namespace deltae
