#include "chromatic_adaptation.hh"

#include <cmath>

#include "value_error.hh"

namespace deltae
{
  Matrix3x3 coneResponseMatrix(AdaptationMethod method)
  {
    switch (method)
      {
      case AdaptationMethod::XyzScaling:
        return XYZ_SCALING;
      case AdaptationMethod::Bradford:
        return BRADFORD;
      case AdaptationMethod::VonKries:
        return VON_KRIES;
      }
    return XYZ_SCALING;
  }

  Matrix3x3 coneResponseMatrixInverse(AdaptationMethod method)
  {
    switch (method)
      {
      case AdaptationMethod::XyzScaling:
        return XYZ_SCALING;
      case AdaptationMethod::Bradford:
        return BRADFORD_INV;
      case AdaptationMethod::VonKries:
        return VON_KRIES_INV;
      }
    return XYZ_SCALING;
  }

  static void checkWhitePoint(const Illuminant& illuminant)
  {
    const Matrix3x1 white = illuminant.whitePoint();
    for (double v : white.inner)
      {
        if (v == 0.0 || !std::isfinite(v))
          throw InvalidInput("illuminant " + illuminant.name()
                             + " has a degenerate white point");
      }
  }

  Matrix3x1 coneResponse(const Illuminant& illuminant, AdaptationMethod method)
  {
    return coneResponseMatrix(method) * illuminant.whitePoint();
  }

  Matrix3x3 adaptationMatrix(const Illuminant& source,
                             const Illuminant& destination,
                             AdaptationMethod method)
  {
    checkWhitePoint(source);
    checkWhitePoint(destination);

    const Matrix3x1 src = coneResponse(source, method);
    const Matrix3x1 dst = coneResponse(destination, method);

    for (double v : src.inner)
      if (v == 0.0)
        throw InvalidInput("zero cone response for illuminant "
                           + source.name());

    const Matrix3x3 scale = Matrix3x3::diagonal(
      {dst.x() / src.x(), dst.y() / src.y(), dst.z() / src.z()});

    return coneResponseMatrixInverse(method) * scale
      * coneResponseMatrix(method);
  }

  Matrix3x1 chromaticAdapt(const Matrix3x1& xyz,
                           const Illuminant& source,
                           const Illuminant& destination,
                           AdaptationMethod method)
  {
    // Identity adaptation, exact
    if (source == destination)
      return xyz;

    return adaptationMatrix(source, destination, method) * xyz;
  }

  XyzValue chromaticAdapt(const XyzValue& xyz,
                          const Illuminant& destination,
                          AdaptationMethod method)
  {
    if (xyz.illuminant() == destination)
      return xyz;

    const Matrix3x1 adapted =
      chromaticAdapt(xyz.vector(), xyz.illuminant(), destination, method);
    return XyzValue(adapted.x(),
                    adapted.y(),
                    adapted.z(),
                    destination,
                    detail::unchecked);
  }
} // namespace deltae
