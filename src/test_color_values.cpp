#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "deltae.hh"

using namespace deltae;

template <typename Error, typename F>
static bool throws(F f)
{
  try
    {
      f();
    }
  catch (const Error&)
    {
      return true;
    }
  return false;
}

void testLabBounds()
{
  // Limits are inclusive
  LabValue lo(0.0, -128.0, -128.0);
  LabValue hi(100.0, 128.0, 128.0);
  LabValue mixed(0.0, -128.0, 128.0);
  assert(lo.l() == 0.0 && hi.b() == 128.0 && mixed.a() == -128.0);

  assert(throws<OutOfBounds>([] { LabValue(100.0001, 0.0, 0.0); }));
  assert(throws<OutOfBounds>([] { LabValue(-0.1, 0.0, 0.0); }));
  assert(throws<OutOfBounds>([] { LabValue(50.0, 128.5, 0.0); }));
  assert(throws<OutOfBounds>([] { LabValue(50.0, 0.0, -200.0); }));
  assert(throws<OutOfBounds>([] { LabValue(NAN, 0.0, 0.0); }));

  try
    {
      LabValue(100.0001, 0.0, 0.0);
      assert(false);
    }
  catch (const ValueError& err)
    {
      assert(err.kind() == ValueErrorKind::OutOfBounds);
      assert(std::string(err.what())
             == "value is out of range: '[L:100.0001, a:0, b:0]'");
    }

  std::cout << "Lab bounds test passed!" << std::endl;
}

void testLchXyzBounds()
{
  LchValue lch(50.0, LCH_MAX_CHROMA, 360.0);
  assert(lch.c() == LCH_MAX_CHROMA);
  assert(throws<OutOfBounds>([] { LchValue(50.0, 181.02, 0.0); }));
  assert(throws<OutOfBounds>([] { LchValue(50.0, -1.0, 0.0); }));
  assert(throws<OutOfBounds>([] { LchValue(50.0, 10.0, 360.5); }));

  // XYZ is only bounded below
  XyzValue xyz(0.5, 1.0, 1.2, StandardIlluminant::D65);
  assert(xyz.z() == 1.2);
  assert(xyz.illuminant() == Illuminant(StandardIlluminant::D65));
  assert(throws<OutOfBounds>([] { XyzValue(-0.01, 0.5, 0.5); }));
  assert(throws<OutOfBounds>([] { XyzValue(INFINITY, 0.5, 0.5); }));

  std::cout << "Lch/XYZ bounds test passed!" << std::endl;
}

void testRgb()
{
  assert(RgbValue{}.invert() == (RgbValue{255, 255, 255}));
  assert((RgbValue{64, 128, 192}).invert() == (RgbValue{191, 127, 63}));

  RgbNominalValue nom = RgbValue{64, 128, 255}.nominalize();
  assert(std::abs(nom.r() - 0.2509804) < 1e-6);
  assert(std::abs(nom.g() - 0.5019608) < 1e-6);
  assert(nom.b() == 1.0);
  assert(RgbValue{}.nominalize().r() == 0.0);

  assert(RgbNominalValue(0.2509804, 0.5019608, 1.0).denominalize()
         == (RgbValue{64, 128, 255}));
  assert(RgbNominalValue().denominalize() == RgbValue{});

  // Overshoot from matrix math is clamped, not rejected
  RgbNominalValue over(1.2, -0.3, NAN);
  assert(over.r() == 1.0 && over.g() == 0.0 && over.b() == 0.0);
  assert(over.denominalize() == (RgbValue{255, 0, 0}));

  std::cout << "RGB test passed!" << std::endl;
}

void testIlluminant()
{
  assert(Illuminant() == Illuminant(StandardIlluminant::D50));
  assert(Illuminant::other(0.96422, 1.0, 0.82521) == Illuminant(StandardIlluminant::D50));
  assert(!(Illuminant(StandardIlluminant::D65) == Illuminant(StandardIlluminant::D50)));
  assert(!Illuminant::other(1.0, 1.0, 1.0).isStandard());
  assert(Illuminant::other(1.0, 1.0, 1.0) == Illuminant(StandardIlluminant::E));
  assert(Illuminant(StandardIlluminant::F11).name() == "F11");

  std::cout << "Illuminant test passed!" << std::endl;
}

void testParse()
{
  assert(parseLab("92.5, 33.5, -18.8") == LabValue(92.5, 33.5, -18.8));
  assert(parseLab("92.5,33.5,-18.8") == LabValue(92.5, 33.5, -18.8));
  assert(parseLab("  50 ,  +0 , 0  ") == LabValue(50.0, 0.0, 0.0));

  assert(throws<BadFormat>([] { parseLab("92.5,33.5"); }));
  assert(throws<BadFormat>([] { parseLab("92.5, 33.5, -18.8, 1"); }));
  assert(throws<BadFormat>([] { parseLab("92.5, abc, -18.8"); }));
  assert(throws<BadFormat>([] { parseLab("92.5, 3x, -18.8"); }));
  assert(throws<BadFormat>([] { parseLab(""); }));
  assert(throws<OutOfBounds>([] { parseLab("101, 0, 0"); }));
  assert(throws<BadFormat>([] { parseLab("nan, 0, 0"); }));
  assert(throws<BadFormat>([] { parseLab("50, inf, 0"); }));
  assert(throws<BadFormat>([] { parseLab("50, 0, -infinity"); }));
  assert(throws<BadFormat>([] { parseXyz("0.5, NAN, 0.5"); }));

  assert(parseLch("89.73, 7.2094, 285.1157") == LchValue(89.73, 7.2094, 285.1157));
  assert(throws<OutOfBounds>([] { parseLch("50, 10, 400"); }));

  XyzValue xyz = parseXyz("0.5, 0.5, 1.2", StandardIlluminant::D65);
  assert(xyz.x() == 0.5 && xyz.illuminant() == Illuminant(StandardIlluminant::D65));
  assert(throws<OutOfBounds>([] { parseXyz("-0.1, 0.5, 0.5"); }));

  assert(parseRgb("64, 128, 192") == (RgbValue{64, 128, 192}));
  assert(throws<OutOfBounds>([] { parseRgb("256, 0, 0"); }));
  assert(throws<BadFormat>([] { parseRgb("1.5, 0, 0"); }));

  assert(parsePrecision("4") == 4);
  assert(parsePrecision(" 0 ") == 0);
  assert(parsePrecision("17") == MAX_PRECISION);
  assert(throws<BadFormat>([] { parsePrecision("abc"); }));
  assert(throws<BadFormat>([] { parsePrecision("-1"); }));
  assert(throws<BadFormat>([] { parsePrecision("2.5"); }));
  assert(throws<BadFormat>([] { parsePrecision("4x"); }));
  assert(throws<BadFormat>([] { parsePrecision(""); }));
  assert(throws<BadFormat>([] { parsePrecision("18"); }));

  std::cout << "Parse test passed!" << std::endl;
}

void testDisplay()
{
  assert(toString(LabValue(89.73, 1.88, -6.96)) == "[L:89.73, a:1.88, b:-6.96]");
  assert(toString(LabValue(89.73, 1.88, -6.96), 1) == "[L:89.7, a:1.9, b:-7.0]");
  assert(toString(LchValue(50.0, 10.0, 90.0), 2) == "[L:50.00, c:10.00, h:90.00]");
  assert(toString(XyzValue(0.5, 1.0, 0.25)) == "[X:0.5, Y:1, Z:0.25]");
  assert(toString(RgbValue{64, 128, 192}) == "[R:64, G:128, B:192]");
  assert(toString(RgbSystem::SRgb) == "sRGB");
  assert(toString(RgbSystem::Beta) == "Beta RGB");
  assert(toString(RgbSystemValue{RgbValue{64, 128, 192}, RgbSystem::Adobe1998})
         == "[R:64, G:128, B:192] Adobe RGB (1998)");
  for (int ss = 0; ss <= static_cast<int>(RgbSystem::WideGamut); ++ss)
    assert(!toString(static_cast<RgbSystem>(ss)).empty());

  std::cout << "Display test passed!" << std::endl;
}

void testRound()
{
  assert(roundTo(1.234567890, 4) == 1.2346);
  assert(roundTo(-1.23455, 2) == -1.23);

  LabValue lab = roundTo(LabValue(89.73456, 1.88111, -6.96999), 2);
  assert(lab == LabValue(89.73, 1.88, -6.97));

  DeltaE de = roundTo(DeltaE(DE2000{}, 5.316938317938254), 4);
  assert(de.value() == 5.3169);
  assert(std::holds_alternative<DE2000>(de.method()));

  std::cout << "Round test passed!" << std::endl;
}

int main()
{
  testLabBounds();
  testLchXyzBounds();
  testRgb();
  testIlluminant();
  testParse();
  testDisplay();
  testRound();
  std::cout << "All tests passed!" << std::endl;
  return 0;
}
