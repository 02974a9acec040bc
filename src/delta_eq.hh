#pragma once

#include <compare>

#include "delta_e.hh"

namespace deltae
{
  /*
   * Threshold for deciding that two colors are indistinguishable. Two colors
   * with a DE2000 below 1.0 are commonly considered the same, hence the
   * default.
   *
   * Comparisons only look at the numeric value; the caller has to compare
   * against a DeltaE computed with the same method.
   */
  class Tolerance
  {
  public:
    Tolerance()
      : delta_(DE2000{}, 1.0)
    {}
    Tolerance(const DEMethod& method, double value)
      : delta_(method, value)
    {}
    Tolerance(const DeltaE& delta)
      : delta_(delta)
    {}

    const DeltaE& deltaE() const { return delta_; }
    const DEMethod& method() const { return delta_.method(); }
    double value() const { return delta_.value(); }

    bool operator==(const Tolerance& rhs) const { return value() == rhs.value(); }
    bool operator==(const DeltaE& rhs) const { return value() == rhs.value(); }
    std::partial_ordering operator<=>(const Tolerance& rhs) const
    {
      return value() <=> rhs.value();
    }
    std::partial_ordering operator<=>(const DeltaE& rhs) const
    {
      return value() <=> rhs.value();
    }

  private:
    DeltaE delta_;
  };

  // True when the Delta E between both colors, computed with the
  // tolerance's method, does not exceed the tolerance
  template <LabConvertible A, LabConvertible B>
  bool deltaEq(const A& lhs,
               const B& rhs,
               const Tolerance& tolerance = Tolerance(),
               const conversion_params& params = {})
  {
    return delta(lhs, rhs, tolerance.method(), params) <= tolerance;
  }
} // namespace deltae
