/***
 * Name: test_typed_python_object
 * Purpose: Shape tags add accessors without changing the handle's size or
 *   validating the wrapped object.
 */
#include <gtest/gtest.h>

#include <string>

#include "pyhost/exceptions/python_error.h"
#include "pyhost/object/typed_python_object.h"
#include "pyhost/python.h"
#include "pyhost/runtime/interpreter.h"

using namespace pyhost;

static_assert(sizeof(TypedPythonObject<shape::List>) == sizeof(PythonObject));
static_assert(sizeof(TypedPythonObject<shape::Module>) == sizeof(PythonObject));

TEST(ObjectTyped, TupleAndList) {
  const auto tuple = TypedPythonObject<shape::Tuple>::Unchecked(PythonObject::Tuple({1, "a"}));
  EXPECT_EQ(tuple.Size(), 2u);
  EXPECT_EQ(tuple.At(1).ToString(), "a");
  EXPECT_THROW(tuple.At(5), exceptions::PythonError);

  const auto list = TypedPythonObject<shape::List>::Unchecked(PythonObject::List({3, 4, 5}));
  EXPECT_EQ(list.Size(), 3u);
  EXPECT_EQ(list.At(2).ToInt64(), 5);
  EXPECT_EQ(list->ReprString(), "[3, 4, 5]");
  EXPECT_STREQ(TypedPythonObject<shape::List>::ShapeName(), "List");
}

TEST(ObjectTyped, DictSize) {
  const auto dict = TypedPythonObject<shape::Dict>::Unchecked(PythonObject::Dict({{"k", 1}, {"j", 2}}));
  EXPECT_EQ(dict.Size(), 2u);
}

TEST(ObjectTyped, ModuleNameAndAttributes) {
  runtime::Interpreter::Require();
  auto module = TypedPythonObject<shape::Module>::Unchecked(PythonObject::FromOwned(PyModule_New("pyhost_scratch")));
  EXPECT_EQ(module.Name(), "pyhost_scratch");
  module.AddObject("ANSWER", PythonObject(42));
  EXPECT_EQ(module->Attr("ANSWER").ToInt64(), 42);
  EXPECT_EQ(python::ImportModule("math").Name(), "math");
}

TEST(ObjectTyped, TypeNameAndInstanceCheck) {
  const auto intType = python::Type(PythonObject(1));
  EXPECT_EQ(intType.Name(), "int");
  EXPECT_TRUE(intType.IsInstance(PythonObject(true)));
  EXPECT_FALSE(intType.IsInstance(PythonObject("1")));
}

TEST(ObjectTyped, TagIsNotValidated) {
  // A list wearing a Tuple tag: the tag is trusted, the C API reports the misuse.
  const auto wrong = TypedPythonObject<shape::Tuple>::Unchecked(PythonObject::List({1}));
  EXPECT_THROW(wrong.Size(), exceptions::PythonError);
  const PythonObject& plain = wrong;
  EXPECT_EQ(plain.TypeName(), "list");
}
