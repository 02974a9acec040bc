#pragma once

#include <compare>
#include <concepts>
#include <variant>

#include "color_values.hh"
#include "rgb_to_lab.hh"

namespace deltae
{
  // The original Delta E: euclidean distance in Lab space
  struct DE1976
  {
    bool operator==(const DE1976&) const = default;
  };

  // CIE94, weighted for graphic arts or for textiles.
  // Symmetric variant, see deltaE1994().
  struct DE1994
  {
    bool textile = false;

    bool operator==(const DE1994&) const = default;
  };

  // CIEDE2000, the default method
  struct DE2000
  {
    bool operator==(const DE2000&) const = default;
  };

  // CMC l:c, with lightness and chroma tolerance weights
  struct DECMC
  {
    double tolerance_l = 1.0;
    double tolerance_c = 1.0;

    bool operator==(const DECMC&) const = default;
  };

  // Default constructed to DE2000
  using DEMethod = std::variant<DE2000, DE1976, DE1994, DECMC>;

  inline constexpr DE1994 DE1994G{false};
  inline constexpr DE1994 DE1994T{true};
  // CMC(1:1) and CMC(2:1)
  inline constexpr DECMC DECMC1{1.0, 1.0};
  inline constexpr DECMC DECMC2{2.0, 1.0};

  /*
   * The measured difference between two colors.
   *
   * Ordering only looks at the value. A DE2000 of 1.0 is not the same
   * amount of difference as a DE1976 of 1.0, so comparing results of
   * different methods is meaningless.
   */
  class DeltaE
  {
  public:
    DeltaE(const DEMethod& method, double value)
      : method_(method)
      , value_(value)
    {}

    const DEMethod& method() const { return method_; }
    double value() const { return value_; }

    bool operator==(const DeltaE&) const = default;
    bool operator==(double value) const { return value_ == value; }
    std::partial_ordering operator<=>(const DeltaE& rhs) const
    {
      return value_ <=> rhs.value_;
    }

  private:
    DEMethod method_;
    double value_;
  };

  double deltaE1976(const LabValue& lhs, const LabValue& rhs);
  double deltaE1994(const LabValue& lhs, const LabValue& rhs, bool textile);
  double deltaE2000(const LabValue& lhs, const LabValue& rhs);
  // `lhs` is the reference sample: the result is not symmetric
  double deltaECmc(const LabValue& lhs,
                   const LabValue& rhs,
                   double tolerance_l,
                   double tolerance_c);

  double deltaEValue(const LabValue& lhs, const LabValue& rhs, const DEMethod& method);

  // Any color with a conversion into the comparable Lab form
  template <typename T>
  concept LabConvertible = requires(const T& color, const conversion_params& params)
  {
    { toLab(color, params) } -> std::convertible_to<LabValue>;
  };

  template <LabConvertible A, LabConvertible B>
  DeltaE delta(const A& lhs,
               const B& rhs,
               const DEMethod& method = DEMethod(),
               const conversion_params& params = {})
  {
    return DeltaE(method, deltaEValue(toLab(lhs, params), toLab(rhs, params), method));
  }
} // namespace deltae
