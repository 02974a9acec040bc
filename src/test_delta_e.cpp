#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "deltae.hh"

using namespace deltae;

static bool near(double a, double b, double tolerance)
{
  return std::abs(a - b) < tolerance;
}

const LabValue LAB0(89.73, 1.88, -6.96);
const LabValue LAB1(95.08, -0.17, -10.81);

void testReferenceValues()
{
  assert(near(delta(LAB0, LAB1).value(), 5.316938, 1e-6));
  assert(near(delta(LAB0, LAB1, DE1976{}).value(), 6.902717, 1e-6));
  assert(near(delta(LAB0, LAB1, DE1994G).value(), 6.323467, 1e-6));
  assert(near(delta(LAB0, LAB1, DE1994T).value(), 4.283559, 1e-6));
  assert(near(delta(LAB0, LAB1, DECMC1).value(), 6.141097, 1e-6));
  assert(near(delta(LAB0, LAB1, DECMC2).value(), 5.206915, 1e-6));

  // Published CIEDE2000 test pairs
  struct sample
  {
    LabValue lhs;
    LabValue rhs;
    double expected;
  };
  const std::vector<sample> pairs = {
    {LabValue(50.0, 2.6772, -79.7751), LabValue(50.0, 0.0, -82.7485), 2.0425},
    {LabValue(50.0, 0.0, 0.0), LabValue(50.0, -1.0, 2.0), 2.3669},
    {LabValue(50.0, 2.49, -0.001), LabValue(50.0, -2.49, 0.0009), 7.1792},
    {LabValue(50.0, 2.5, 0.0), LabValue(50.0, 0.0, -2.5), 4.3065},
    {LabValue(50.0, 2.5, 0.0), LabValue(73.0, 25.0, -18.0), 27.1492},
    {LabValue(60.2574, -34.0099, 36.2677), LabValue(60.4626, -34.1751, 39.4387), 1.2644},
    {LabValue(2.0776, 0.0795, -1.135), LabValue(0.9033, -0.0636, -0.5514), 0.9082},
  };
  for (const sample& s : pairs)
    {
      assert(near(deltaE2000(s.lhs, s.rhs), s.expected, 1e-4));
      assert(near(deltaE2000(s.rhs, s.lhs), s.expected, 1e-4));
    }

  // Dark reference sample uses the fixed lightness weight
  assert(near(deltaECmc(LabValue(10.0, 0.0, 0.0), LabValue(20.0, 0.0, 0.0), 1.0, 1.0),
              19.569472, 1e-6));
  assert(near(deltaE1994(LabValue(10.0, 0.0, 0.0), LabValue(20.0, 0.0, 0.0), false), 10.0, 1e-12));
  assert(near(deltaE1994(LabValue(10.0, 0.0, 0.0), LabValue(20.0, 0.0, 0.0), true), 5.0, 1e-12));
  // A neutral sample makes the mean chroma 0, whichever side it is on
  assert(near(deltaE1994(LabValue(50.0, 0.0, 0.0), LabValue(50.0, 30.0, 40.0), false), 50.0, 1e-12));
  assert(near(deltaE1994(LabValue(50.0, 30.0, 40.0), LabValue(50.0, 0.0, 0.0), false), 50.0, 1e-12));

  std::cout << "Reference values test passed!" << std::endl;
}

void testSymmetry()
{
  const std::vector<LabValue> colors = {LAB0,
                                        LAB1,
                                        LabValue(50.0, 2.5, 0.0),
                                        LabValue(50.0, 0.0, -2.5),
                                        LabValue(0.0, 0.0, 0.0),
                                        LabValue(100.0, -128.0, 128.0),
                                        LabValue(33.3, 60.0, -90.0)};
  const std::vector<DEMethod> methods = {DE2000{}, DE1976{}, DE1994G, DE1994T};

  for (const LabValue& x : colors)
    for (const LabValue& y : colors)
      for (const DEMethod& method : methods)
        {
          const double forward = deltaEValue(x, y, method);
          const double reverse = deltaEValue(y, x, method);
          assert(near(forward, reverse, 1e-9));
          assert(forward >= 0.0);
        }

  // CMC weighs by the reference sample, so order matters
  assert(near(delta(LAB1, LAB0, DECMC1).value(), 5.641624, 1e-6));
  assert(near(delta(LAB1, LAB0, DECMC2).value(), 4.656557, 1e-6));
  assert(delta(LAB0, LAB1, DECMC1) != delta(LAB1, LAB0, DECMC1));

  std::cout << "Symmetry test passed!" << std::endl;
}

void testIdentity()
{
  const std::vector<DEMethod> methods = {DE2000{}, DE1976{}, DE1994G, DE1994T,
                                         DECMC1, DECMC2};
  const std::vector<LabValue> colors = {LAB0, LabValue(0.0, 0.0, 0.0),
                                        LabValue(50.0, 0.0, 0.0),
                                        LabValue(100.0, 128.0, -128.0)};
  for (const DEMethod& method : methods)
    for (const LabValue& color : colors)
      assert(delta(color, color, method).value() == 0.0);

  std::cout << "Identity test passed!" << std::endl;
}

void testTolerance()
{
  const LabValue reference(50.0, 20.0, 30.0);
  const LabValue close(50.1, 19.9, 30.2);
  const LabValue far(55.0, 25.0, 35.0);

  assert(near(delta(reference, close).value(), 0.1819, 1e-4));
  assert(near(delta(reference, far).value(), 5.5923, 1e-4));
  assert(deltaEq(reference, close));
  assert(!deltaEq(reference, far));
  assert(deltaEq(reference, far, Tolerance(DE2000{}, 6.0)));
  assert(!deltaEq(reference, far, Tolerance(DE1976{}, 6.0)));

  // A tolerance equal to the measured difference still matches
  const DeltaE measured = delta(reference, far);
  assert(deltaEq(reference, far, measured));

  const Tolerance tolerance;
  assert(tolerance.value() == 1.0);
  assert(std::holds_alternative<DE2000>(tolerance.method()));
  assert(tolerance == DeltaE(DE2000{}, 1.0));
  assert(tolerance < DeltaE(DE2000{}, 1.5));
  assert(DeltaE(DE2000{}, 0.5) <= tolerance);
  assert(Tolerance(DE1976{}, 2.0) > tolerance);

  assert(DeltaE(DE2000{}, 1.0) == 1.0);
  assert(DeltaE(DE2000{}, 1.0) < DeltaE(DE2000{}, 2.0));
  assert(!(DeltaE(DE2000{}, 1.0) == DeltaE(DE1976{}, 1.0)));

  std::cout << "Tolerance test passed!" << std::endl;
}

void testCrossType()
{
  const double expected = delta(LAB0, LAB1).value();

  assert(near(delta(labToLch(LAB0), LAB1).value(), expected, 1e-9));
  assert(near(delta(LAB0, labToLch(LAB1)).value(), expected, 1e-9));
  assert(near(delta(labToXyz(LAB0), LAB1).value(), expected, 1e-6));

  // D65 XYZ is adapted to the D50 comparison space
  const XyzValue d65 = rgbToXyz(RgbValue{64, 128, 192});
  assert(near(delta(d65, rgbToLab(RgbValue{64, 128, 192})).value(), 0.0, 1e-9));
  assert(delta(RgbValue{64, 128, 192}, d65).value() == 0.0);

  // The same 8-bit triple means different colors in different systems
  const RgbSystemValue srgb{RgbValue{64, 128, 192}, RgbSystem::SRgb};
  const RgbSystemValue adobe{RgbValue{64, 128, 192}, RgbSystem::Adobe1998};
  assert(delta(srgb, RgbValue{64, 128, 192}).value() == 0.0);
  assert(delta(srgb, adobe).value() > 1.0);

  assert(deltaEq(RgbValue{64, 128, 192}, RgbValue{64, 128, 193}));
  assert(!deltaEq(RgbValue{64, 128, 192}, RgbValue{64, 160, 192}));

  std::cout << "Cross type test passed!" << std::endl;
}

void testMethodParsing()
{
  assert(parseMethod("de2000") == DEMethod(DE2000{}));
  assert(parseMethod("DE00") == DEMethod(DE2000{}));
  assert(parseMethod(" 2000 ") == DEMethod(DE2000{}));
  assert(parseMethod("de1976") == DEMethod(DE1976{}));
  assert(parseMethod("76") == DEMethod(DE1976{}));
  assert(parseMethod("De1994") == DEMethod(DE1994G));
  assert(parseMethod("94g") == DEMethod(DE1994G));
  assert(parseMethod("de94t") == DEMethod(DE1994T));
  assert(parseMethod("cmc") == DEMethod(DECMC1));
  assert(parseMethod("DECMC1") == DEMethod(DECMC1));
  assert(parseMethod("cmc2") == DEMethod(DECMC2));

  bool thrown = false;
  try
    {
      parseMethod("de3000");
    }
  catch (const InvalidInput&)
    {
      thrown = true;
    }
  assert(thrown);

  std::cout << "Method parsing test passed!" << std::endl;
}

void testDisplay()
{
  assert(toString(DeltaE(DE2000{}, 1.0)) == "1 DE2000");
  assert(toString(DeltaE(DE2000{}, 1.0), 4) == "1.0000 DE2000");
  assert(toString(roundTo(delta(LAB0, LAB1), 4)) == "5.3169 DE2000");
  assert(toString(DEMethod(DE1976{})) == "DE1976");
  assert(toString(DEMethod(DE1994G)) == "DE1994");
  assert(toString(DEMethod(DE1994T)) == "DE1994T");
  assert(toString(DEMethod(DECMC1), 4) == "DECMC(1.0000:1.0000)");
  assert(toString(DEMethod(DECMC{1.0, 2.0})) == "DECMC(1:2)");
  assert(toString(DeltaE(DECMC2, 0.5)) == "0.5 DECMC(2:1)");

  std::cout << "Display test passed!" << std::endl;
}

int main()
{
  testReferenceValues();
  testSymmetry();
  testIdentity();
  testTolerance();
  testCrossType();
  testMethodParsing();
  testDisplay();
  std::cout << "All tests passed!" << std::endl;
  return 0;
}
