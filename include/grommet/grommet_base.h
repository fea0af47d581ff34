/*
 * The core imports for the python facing half of grommet. Use this to ensure the correct import order can be
 * maintained. The engine headers under grommet/engine and grommet/runtime do not depend on nanobind and must not
 * include this file.
 */

#ifndef GROMMET_BASE_H
#define GROMMET_BASE_H

#include <nanobind/nanobind.h>

#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <fmt/format.h>

#include <grommet/grommet_export.h>
#include <grommet/grommet_forward_declarations.h>

namespace nb = nanobind;
using namespace nb::literals;

#endif // GROMMET_BASE_H
