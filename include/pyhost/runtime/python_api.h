/***
 * Name: pyhost::runtime (C API include)
 * Purpose: Single include point for the CPython C API.
 * Theory of Operation: Python.h must be seen before any standard header and
 *   with PY_SSIZE_T_CLEAN defined; every pyhost header that touches PyObject
 *   includes this file first.
 */
#pragma once

#ifndef PY_SSIZE_T_CLEAN
#define PY_SSIZE_T_CLEAN
#endif
#include <Python.h>
