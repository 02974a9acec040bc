#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#define DELTAE_DEFAULT_THRESHOLD                                               \
  1.0 // just noticeable difference under DE2000

  enum deltae_status
  {
    DELTAE_OK = 0,
    DELTAE_OUT_OF_BOUNDS,
    DELTAE_BAD_FORMAT,
    DELTAE_INVALID_INPUT
  };

  enum deltae_method_kind
  {
    DELTAE_DE2000 = 0,
    DELTAE_DE1976,
    DELTAE_DE1994,
    DELTAE_DECMC
  };

  struct deltae_lab
  {
    double l, a, b;
  };

  struct deltae_params
  {
    enum deltae_method_kind method;
    int textile;        // DE1994 only
    double tolerance_l; // DECMC only
    double tolerance_c; // DECMC only
    double threshold;   // deltae_equal only
  };

  // DE2000, threshold 1.0
  void deltae_default_params(struct deltae_params* params);

  int deltae_parse_lab(const char* text, struct deltae_lab* out);
  // Only the method fields of `params` are written
  int deltae_parse_method(const char* text, struct deltae_params* params);

  // DELTAE_INVALID_INPUT for DECMC weights that are not positive and finite
  int deltae_compute(const struct deltae_lab* lhs,
                     const struct deltae_lab* rhs,
                     const struct deltae_params* params,
                     double* out);

  // `*out` is set to 1 when the colors are within params->threshold
  int deltae_equal(const struct deltae_lab* lhs,
                   const struct deltae_lab* rhs,
                   const struct deltae_params* params,
                   int* out);

#ifdef __cplusplus
}
#endif
