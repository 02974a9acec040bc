#include "rgb_to_lab.hh"

#include <cmath>
#include <numbers>

namespace deltae
{
  // CIE standard: kappa = 903.3, epsilon = 0.008856
  constexpr double KAPPA = 24389.0 / 27.0;
  constexpr double EPSILON = 216.0 / 24389.0;
  // cbrt(EPSILON) = 6 / 29
  constexpr double CBRT_EPSILON = 6.0 / 29.0;

  constexpr double DEG = 180.0 / std::numbers::pi;

  double hueAngle(double a, double b)
  {
    // atan2(-0, -0) is -pi
    if (a == 0.0 && b == 0.0)
      return 0.0;

    double h = std::atan2(b, a) * DEG;
    if (h < 0.0)
      h += 360.0;
    // -0.0 and rounding of tiny negative angles
    if (h >= 360.0)
      h -= 360.0;
    return h;
  }

  //******************************************************
  //**                                                  **
  //**                   Lab <-> Lch                    **
  //**                                                  **
  //******************************************************

  LchValue labToLch(const LabValue& lab)
  {
    const double c = std::sqrt(lab.a() * lab.a() + lab.b() * lab.b());
    return LchValue(lab.l(), c, hueAngle(lab.a(), lab.b()), detail::unchecked);
  }

  LabValue lchToLab(const LchValue& lch)
  {
    const double h = lch.hueRadians();
    return LabValue(lch.l(),
                    lch.c() * std::cos(h),
                    lch.c() * std::sin(h),
                    detail::unchecked);
  }

  //******************************************************
  //**                                                  **
  //**                   XYZ <-> Lab                    **
  //**                                                  **
  //******************************************************

  static double labCompress(double t)
  {
    return (t > EPSILON) ? std::cbrt(t) : (KAPPA * t + 16.0) / 116.0;
  }

  static double labExpand(double f)
  {
    return (f > CBRT_EPSILON) ? f * f * f : (116.0 * f - 16.0) / KAPPA;
  }

  LabValue xyzToLab(const XyzValue& xyz)
  {
    const Matrix3x1 white = xyz.illuminant().whitePoint();

    // Normalize by the reference white
    const double fx = labCompress(xyz.x() / white.x());
    const double fy = labCompress(xyz.y() / white.y());
    const double fz = labCompress(xyz.z() / white.z());

    return LabValue(116.0 * fy - 16.0,
                    500.0 * (fx - fy),
                    200.0 * (fy - fz),
                    detail::unchecked);
  }

  XyzValue labToXyz(const LabValue& lab, const Illuminant& illuminant)
  {
    const double fy = (lab.l() + 16.0) / 116.0;
    const double fx = lab.a() / 500.0 + fy;
    const double fz = fy - lab.b() / 200.0;

    const double xr = labExpand(fx);
    const double yr = (lab.l() > KAPPA * EPSILON) ? fy * fy * fy : lab.l() / KAPPA;
    const double zr = labExpand(fz);

    const Matrix3x1 white = illuminant.whitePoint();
    return XyzValue(xr * white.x(),
                    yr * white.y(),
                    zr * white.z(),
                    illuminant,
                    detail::unchecked);
  }

  LchValue xyzToLch(const XyzValue& xyz)
  {
    return labToLch(xyzToLab(xyz));
  }

  XyzValue lchToXyz(const LchValue& lch, const Illuminant& illuminant)
  {
    return labToXyz(lchToLab(lch), illuminant);
  }

  //******************************************************
  //**                                                  **
  //**                   RGB <-> XYZ                    **
  //**                                                  **
  //******************************************************

  XyzValue rgbToXyz(const RgbValue& rgb, RgbSystem system)
  {
    const rgb_system_info& info = rgbSystemInfo(system);

    // Convert from 0-255 range to 0-1 range, then to linear light
    const RgbNominalValue nominal = rgb.nominalize();
    const Matrix3x1 linear{info.companding.linearize(nominal.r()),
                           info.companding.linearize(nominal.g()),
                           info.companding.linearize(nominal.b())};

    const Matrix3x1 xyz = info.rgb_to_xyz * linear;
    return XyzValue(xyz.x(), xyz.y(), xyz.z(), info.illuminant, detail::unchecked);
  }

  RgbValue xyzToRgb(const XyzValue& xyz, RgbSystem system, AdaptationMethod method)
  {
    const rgb_system_info& info = rgbSystemInfo(system);

    const Matrix3x1 adapted =
      chromaticAdapt(xyz.vector(), xyz.illuminant(), info.illuminant, method);
    const Matrix3x1 linear = info.xyz_to_rgb * adapted;

    // Out of gamut channels are clamped by RgbNominalValue
    const RgbNominalValue nominal(info.companding.compand(linear.x()),
                                  info.companding.compand(linear.y()),
                                  info.companding.compand(linear.z()));
    return nominal.denominalize();
  }

  LabValue rgbToLab(const RgbValue& rgb,
                    RgbSystem system,
                    const Illuminant& illuminant,
                    AdaptationMethod method)
  {
    return xyzToLab(chromaticAdapt(rgbToXyz(rgb, system), illuminant, method));
  }

  RgbValue labToRgb(const LabValue& lab,
                    RgbSystem system,
                    const Illuminant& illuminant,
                    AdaptationMethod method)
  {
    return xyzToRgb(labToXyz(lab, illuminant), system, method);
  }

  LchValue rgbToLch(const RgbValue& rgb, RgbSystem system)
  {
    return labToLch(rgbToLab(rgb, system));
  }

  RgbValue lchToRgb(const LchValue& lch, RgbSystem system)
  {
    return labToRgb(lchToLab(lch), system);
  }

  //******************************************************
  //**                                                  **
  //**                Comparable Lab form               **
  //**                                                  **
  //******************************************************

  LabValue toLab(const LabValue& lab, const conversion_params&)
  {
    return lab;
  }

  LabValue toLab(const LchValue& lch, const conversion_params&)
  {
    return lchToLab(lch);
  }

  LabValue toLab(const XyzValue& xyz, const conversion_params& params)
  {
    return xyzToLab(chromaticAdapt(xyz, params.reference, params.adaptation));
  }

  LabValue toLab(const RgbValue& rgb, const conversion_params& params)
  {
    return toLab(rgbToXyz(rgb, params.rgb_system), params);
  }

  LabValue toLab(const RgbSystemValue& rgb, const conversion_params& params)
  {
    return toLab(rgbToXyz(rgb.value, rgb.system), params);
  }
} // namespace deltae
