#include "illuminant.hh"

namespace deltae
{
  Matrix3x1 whitePoint(StandardIlluminant illuminant)
  {
    switch (illuminant)
      {
      case StandardIlluminant::A:
        return white_point::A;
      case StandardIlluminant::B:
        return white_point::B;
      case StandardIlluminant::C:
        return white_point::C;
      case StandardIlluminant::D50:
        return white_point::D50;
      case StandardIlluminant::D55:
        return white_point::D55;
      case StandardIlluminant::D65:
        return white_point::D65;
      case StandardIlluminant::D75:
        return white_point::D75;
      case StandardIlluminant::E:
        return white_point::E;
      case StandardIlluminant::F2:
        return white_point::F2;
      case StandardIlluminant::F7:
        return white_point::F7;
      case StandardIlluminant::F11:
        return white_point::F11;
      }
    return white_point::D50;
  }

  static const char* standardName(StandardIlluminant illuminant)
  {
    switch (illuminant)
      {
      case StandardIlluminant::A:
        return "A";
      case StandardIlluminant::B:
        return "B";
      case StandardIlluminant::C:
        return "C";
      case StandardIlluminant::D50:
        return "D50";
      case StandardIlluminant::D55:
        return "D55";
      case StandardIlluminant::D65:
        return "D65";
      case StandardIlluminant::D75:
        return "D75";
      case StandardIlluminant::E:
        return "E";
      case StandardIlluminant::F2:
        return "F2";
      case StandardIlluminant::F7:
        return "F7";
      case StandardIlluminant::F11:
        return "F11";
      }
    return "D50";
  }

  Illuminant Illuminant::other(double x, double y, double z)
  {
    return Illuminant(Matrix3x1{x, y, z});
  }

  Matrix3x1 Illuminant::whitePoint() const
  {
    if (const auto* standard = std::get_if<StandardIlluminant>(&value_))
      return deltae::whitePoint(*standard);
    return std::get<Matrix3x1>(value_);
  }

  bool Illuminant::isStandard() const
  {
    return std::holds_alternative<StandardIlluminant>(value_);
  }

  std::string Illuminant::name() const
  {
    if (const auto* standard = std::get_if<StandardIlluminant>(&value_))
      return standardName(*standard);
    return "Other";
  }

  bool Illuminant::operator==(const Illuminant& rhs) const
  {
    return whitePoint() == rhs.whitePoint();
  }
} // namespace deltae
