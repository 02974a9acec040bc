#pragma once

#include "chromatic_adaptation.hh"
#include "color_values.hh"
#include "delta_e.hh"
#include "delta_eq.hh"
#include "display.hh"
#include "illuminant.hh"
#include "matrix.hh"
#include "parse.hh"
#include "rgb_system.hh"
#include "rgb_to_lab.hh"
#include "round.hh"
#include "value_error.hh"
