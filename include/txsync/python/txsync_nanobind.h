/*
 * The nanobind imports used by the _txsync module. Kept out of txsync_base.h so the core library never depends on
 * Python.
 */

#ifndef TXSYNC_NANOBIND_H
#define TXSYNC_NANOBIND_H

#include <txsync/txsync_base.h>

#include <nanobind/nanobind.h>
#include <nanobind/stl/chrono.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace nb::literals;

#endif  // TXSYNC_NANOBIND_H
