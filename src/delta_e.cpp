#include "delta_e.hh"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace deltae
{
  namespace
  {
    template <class... Ts>
    struct overloaded : Ts...
    {
      using Ts::operator()...;
    };

    constexpr double RAD = std::numbers::pi / 180.0;

    double chroma(const LabValue& lab)
    {
      return std::hypot(lab.a(), lab.b());
    }

    // 25^7
    constexpr double POW25_7 = 6103515625.0;

    double chromaWeight(double c)
    {
      const double c7 = std::pow(c, 7.0);
      return std::sqrt(c7 / (c7 + POW25_7));
    }
  } // namespace

  double deltaE1976(const LabValue& lhs, const LabValue& rhs)
  {
    const double dl = lhs.l() - rhs.l();
    const double da = lhs.a() - rhs.a();
    const double db = lhs.b() - rhs.b();
    return std::sqrt(dl * dl + da * da + db * db);
  }

  double deltaE1994(const LabValue& lhs, const LabValue& rhs, bool textile)
  {
    const double kl = textile ? 2.0 : 1.0;
    const double k1 = textile ? 0.048 : 0.045;
    const double k2 = textile ? 0.014 : 0.015;
    const double kc = 1.0;
    const double kh = 1.0;

    const double c1 = chroma(lhs);
    const double c2 = chroma(rhs);

    const double dl = rhs.l() - lhs.l();
    const double dc = c2 - c1;
    const double da = rhs.a() - lhs.a();
    const double db = rhs.b() - lhs.b();
    // Rounding can push this slightly below zero
    const double dh2 = std::max(0.0, da * da + db * db - dc * dc);
    const double dh = std::sqrt(dh2);

    // CIE 116 variant: weights use the geometric mean chroma sqrt(C1 * C2)
    // instead of the reference chroma, so the result is symmetric
    const double c = std::sqrt(c1 * c2);
    const double sl = 1.0;
    const double sc = 1.0 + k1 * c;
    const double sh = 1.0 + k2 * c;

    const double tl = dl / (kl * sl);
    const double tc = dc / (kc * sc);
    const double th = dh / (kh * sh);
    return std::sqrt(tl * tl + tc * tc + th * th);
  }

  double deltaE2000(const LabValue& lhs, const LabValue& rhs)
  {
    const double l1 = lhs.l();
    const double l2 = rhs.l();

    // Blue region compensation of a*
    const double c_avg = (chroma(lhs) + chroma(rhs)) / 2.0;
    const double g = 0.5 * (1.0 - chromaWeight(c_avg));
    const double a1p = lhs.a() * (1.0 + g);
    const double a2p = rhs.a() * (1.0 + g);

    const double c1p = std::hypot(a1p, lhs.b());
    const double c2p = std::hypot(a2p, rhs.b());
    const double h1p = hueAngle(a1p, lhs.b());
    const double h2p = hueAngle(a2p, rhs.b());
    const bool achromatic = (c1p * c2p == 0.0);

    const double dlp = l2 - l1;
    const double dcp = c2p - c1p;

    double dhp = 0.0;
    if (!achromatic)
      {
        dhp = h2p - h1p;
        if (dhp > 180.0)
          dhp -= 360.0;
        else if (dhp < -180.0)
          dhp += 360.0;
      }
    const double dHp = 2.0 * std::sqrt(c1p * c2p) * std::sin(dhp / 2.0 * RAD);

    const double l_avg = (l1 + l2) / 2.0;
    const double c_avgp = (c1p + c2p) / 2.0;

    double h_avgp;
    if (achromatic)
      h_avgp = h1p + h2p;
    else if (std::abs(h1p - h2p) <= 180.0)
      h_avgp = (h1p + h2p) / 2.0;
    else if (h1p + h2p < 360.0)
      h_avgp = (h1p + h2p + 360.0) / 2.0;
    else
      h_avgp = (h1p + h2p - 360.0) / 2.0;

    const double t = 1.0 - 0.17 * std::cos((h_avgp - 30.0) * RAD)
      + 0.24 * std::cos(2.0 * h_avgp * RAD)
      + 0.32 * std::cos((3.0 * h_avgp + 6.0) * RAD)
      - 0.20 * std::cos((4.0 * h_avgp - 63.0) * RAD);

    const double l50 = (l_avg - 50.0) * (l_avg - 50.0);
    const double sl = 1.0 + 0.015 * l50 / std::sqrt(20.0 + l50);
    const double sc = 1.0 + 0.045 * c_avgp;
    const double sh = 1.0 + 0.015 * c_avgp * t;

    // Rotation term for the blue region
    const double rc = 2.0 * chromaWeight(c_avgp);
    const double d_theta =
      30.0 * std::exp(-((h_avgp - 275.0) / 25.0) * ((h_avgp - 275.0) / 25.0));
    const double rt = -std::sin(2.0 * d_theta * RAD) * rc;

    const double tl = dlp / sl;
    const double tc = dcp / sc;
    const double th = dHp / sh;
    return std::sqrt(tl * tl + tc * tc + th * th + rt * tc * th);
  }

  double deltaECmc(const LabValue& lhs,
                   const LabValue& rhs,
                   double tolerance_l,
                   double tolerance_c)
  {
    const double l1 = lhs.l();
    const double c1 = chroma(lhs);
    const double c2 = chroma(rhs);

    const double dl = l1 - rhs.l();
    const double dc = c1 - c2;
    const double da = lhs.a() - rhs.a();
    const double db = lhs.b() - rhs.b();
    const double dh2 = std::max(0.0, da * da + db * db - dc * dc);

    // All weights come from the reference sample
    const double sl = (l1 < 16.0) ? 0.511 : 0.040975 * l1 / (1.0 + 0.01765 * l1);
    const double sc = 0.0638 * c1 / (1.0 + 0.0131 * c1) + 0.638;

    const double c1_4 = c1 * c1 * c1 * c1;
    const double f = std::sqrt(c1_4 / (c1_4 + 1900.0));

    const double h1 = hueAngle(lhs.a(), lhs.b());
    const double t = (h1 >= 164.0 && h1 <= 345.0)
      ? 0.56 + std::abs(0.2 * std::cos((h1 + 168.0) * RAD))
      : 0.36 + std::abs(0.4 * std::cos((h1 + 35.0) * RAD));
    const double sh = sc * (f * t + 1.0 - f);

    const double tl = dl / (tolerance_l * sl);
    const double tc = dc / (tolerance_c * sc);
    return std::sqrt(tl * tl + tc * tc + dh2 / (sh * sh));
  }

  double deltaEValue(const LabValue& lhs, const LabValue& rhs, const DEMethod& method)
  {
    return std::visit(
      overloaded{
        [&](const DE1976&) { return deltaE1976(lhs, rhs); },
        [&](const DE1994& m) { return deltaE1994(lhs, rhs, m.textile); },
        [&](const DE2000&) { return deltaE2000(lhs, rhs); },
        [&](const DECMC& m) {
          return deltaECmc(lhs, rhs, m.tolerance_l, m.tolerance_c);
        },
      },
      method);
  }
} // namespace deltae
