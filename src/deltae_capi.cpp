#include "deltae_capi.h"

#include <cmath>

#include "delta_e.hh"
#include "delta_eq.hh"
#include "parse.hh"
#include "value_error.hh"

using namespace deltae;

/* prototypes */
static DEMethod method_from_params(const deltae_params* params);
static void params_from_method(const DEMethod& method, deltae_params* params);
static int status_from_error(const ValueError& err);
static bool valid_weight(double weight);

extern "C"
{
  void deltae_default_params(struct deltae_params* params)
  {
    if (!params)
      return;

    params->method = DELTAE_DE2000;
    params->textile = 0;
    params->tolerance_l = 1.0;
    params->tolerance_c = 1.0;
    params->threshold = DELTAE_DEFAULT_THRESHOLD;
  }

  int deltae_parse_lab(const char* text, struct deltae_lab* out)
  {
    if (!text || !out)
      return DELTAE_INVALID_INPUT;

    try
      {
        LabValue lab = parseLab(text);
        *out = deltae_lab{lab.l(), lab.a(), lab.b()};
      }
    catch (const ValueError& err)
      {
        return status_from_error(err);
      }
    return DELTAE_OK;
  }

  int deltae_parse_method(const char* text, struct deltae_params* params)
  {
    if (!text || !params)
      return DELTAE_INVALID_INPUT;

    try
      {
        params_from_method(parseMethod(text), params);
      }
    catch (const InvalidInput&)
      {
        return DELTAE_INVALID_INPUT;
      }
    return DELTAE_OK;
  }

  int deltae_compute(const struct deltae_lab* lhs,
                     const struct deltae_lab* rhs,
                     const struct deltae_params* params,
                     double* out)
  {
    if (!lhs || !rhs || !params || !out)
      return DELTAE_INVALID_INPUT;
    if (params->method == DELTAE_DECMC
        && (!valid_weight(params->tolerance_l)
            || !valid_weight(params->tolerance_c)))
      return DELTAE_INVALID_INPUT;

    try
      {
        // Validate both colors before the formulas see them
        LabValue lab0(lhs->l, lhs->a, lhs->b);
        LabValue lab1(rhs->l, rhs->a, rhs->b);
        *out = deltaEValue(lab0, lab1, method_from_params(params));
      }
    catch (const ValueError& err)
      {
        return status_from_error(err);
      }
    return DELTAE_OK;
  }

  int deltae_equal(const struct deltae_lab* lhs,
                   const struct deltae_lab* rhs,
                   const struct deltae_params* params,
                   int* out)
  {
    if (!out)
      return DELTAE_INVALID_INPUT;

    double value = 0.0;
    int status = deltae_compute(lhs, rhs, params, &value);
    if (status != DELTAE_OK)
      return status;

    *out = value <= params->threshold ? 1 : 0;
    return DELTAE_OK;
  }
}

static DEMethod method_from_params(const deltae_params* params)
{
  switch (params->method)
    {
    case DELTAE_DE1976:
      return DE1976{};
    case DELTAE_DE1994:
      return DE1994{params->textile != 0};
    case DELTAE_DECMC:
      return DECMC{params->tolerance_l, params->tolerance_c};
    case DELTAE_DE2000:
      break;
    }
  return DE2000{};
}

static void params_from_method(const DEMethod& method, deltae_params* params)
{
  params->textile = 0;
  params->tolerance_l = 1.0;
  params->tolerance_c = 1.0;

  if (std::holds_alternative<DE2000>(method))
    {
      params->method = DELTAE_DE2000;
    }
  else if (std::holds_alternative<DE1976>(method))
    {
      params->method = DELTAE_DE1976;
    }
  else if (const auto* de94 = std::get_if<DE1994>(&method))
    {
      params->method = DELTAE_DE1994;
      params->textile = de94->textile ? 1 : 0;
    }
  else
    {
      const DECMC& cmc = std::get<DECMC>(method);
      params->method = DELTAE_DECMC;
      params->tolerance_l = cmc.tolerance_l;
      params->tolerance_c = cmc.tolerance_c;
    }
}

static int status_from_error(const ValueError& err)
{
  return err.kind() == ValueErrorKind::OutOfBounds ? DELTAE_OUT_OF_BOUNDS
                                                   : DELTAE_BAD_FORMAT;
}

static bool valid_weight(double weight)
{
  return std::isfinite(weight) && weight > 0.0;
}
