#pragma once

#include "color_values.hh"
#include "illuminant.hh"
#include "matrix.hh"

namespace deltae
{
  /*
   * Reference RGB working spaces, typically associated with an ICC profile
   */
  enum class RgbSystem
  {
    Adobe1998,
    Apple,
    Best,
    Beta,
    Bruce,
    CIE,
    ColorMatch,
    Don,
    ECI,
    EktaSpace,
    NTSC,
    PalSecam,
    ProPhoto,
    SMPTE,
    SRgb,
    WideGamut
  };

  /*
   * Transfer curve between stored RGB and linear light
   */
  struct Companding
  {
    enum class Curve
    {
      Linear,
      Srgb
    };

    Curve curve = Curve::Linear;

    // Stored value -> linear light
    double linearize(double v) const;
    // Linear light -> stored value
    double compand(double v) const;
  };

  struct rgb_system_info
  {
    const char* name;
    Matrix3x3 rgb_to_xyz;
    Matrix3x3 xyz_to_rgb;
    StandardIlluminant illuminant;
    Companding companding;
  };

  const rgb_system_info& rgbSystemInfo(RgbSystem system);

  // An RgbValue together with the working space it is expressed in
  struct RgbSystemValue
  {
    RgbValue value;
    RgbSystem system = RgbSystem::SRgb;

    bool operator==(const RgbSystemValue&) const = default;
  };
} // namespace deltae
