/***
 * Name: test_exceptions
 * Purpose: Exception hierarchy carries messages and is catchable by its base.
 */
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "pyhost/exceptions/arity_error.h"
#include "pyhost/exceptions/config_error.h"
#include "pyhost/exceptions/internal_error.h"
#include "pyhost/exceptions/python_error.h"
#include "pyhost/exceptions/type_mismatch_error.h"

using namespace pyhost::exceptions;

template <class E>
static std::string caughtAsBase(const std::string& message) {
  try {
    throw E(message);
  } catch (const PyhostException& error) {
    return error.what();
  }
  return {};
}

TEST(Exceptions, WhatReturnsMessage) {
  const PythonError error("division by zero");
  EXPECT_STREQ(error.what(), "division by zero");
}

TEST(Exceptions, EveryCategoryDerivesFromBase) {
  EXPECT_EQ(caughtAsBase<PythonError>("p"), "p");
  EXPECT_EQ(caughtAsBase<ArityError>("a"), "a");
  EXPECT_EQ(caughtAsBase<TypeMismatchError>("t"), "t");
  EXPECT_EQ(caughtAsBase<InternalError>("i"), "i");
  EXPECT_EQ(caughtAsBase<ConfigError>("c"), "c");
}

TEST(Exceptions, CatchableAsStdException) {
  try {
    throw ArityError("f() takes exactly 1 arguments (0 given)");
  } catch (const std::exception& error) {
    EXPECT_STREQ(error.what(), "f() takes exactly 1 arguments (0 given)");
    return;
  }
  FAIL() << "not caught";
}
