/***
 * Name: test_python_object_literals
 * Purpose: Host literals and containers become the matching Python objects,
 *   and convert back through As<T>() with type and range checks.
 */
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "pyhost/exceptions/python_error.h"
#include "pyhost/exceptions/type_mismatch_error.h"
#include "pyhost/object/python_object.h"
#include "pyhost/runtime/interpreter.h"

using namespace pyhost;

namespace {

struct Celsius {
  double degrees{0.0};

  PythonObject ToPython() const { return PythonObject(degrees); }
  static Celsius FromPython(const PythonObject& object) { return Celsius{object.ToDouble()}; }
};

}  // namespace

TEST(ObjectLiterals, Scalars) {
  EXPECT_EQ(PythonObject(42).TypeName(), "int");
  EXPECT_EQ(PythonObject(42).ToInt64(), 42);
  EXPECT_EQ(PythonObject(-7L).As<long>(), -7L);
  EXPECT_EQ(PythonObject(true).TypeName(), "bool");
  EXPECT_TRUE(PythonObject(true).As<bool>());
  EXPECT_DOUBLE_EQ(PythonObject(2.5).ToDouble(), 2.5);
  EXPECT_DOUBLE_EQ(PythonObject(1.5F).As<float>(), 1.5F);
}

TEST(ObjectLiterals, Strings) {
  const std::string text = "hello";
  const std::string_view view = "view";
  EXPECT_EQ(PythonObject("plain").ToString(), "plain");
  EXPECT_EQ(PythonObject(text).As<std::string>(), "hello");
  EXPECT_EQ(PythonObject(view).ReprString(), "'view'");
  EXPECT_EQ(PythonObject(std::string("a\0b", 3)).Len(), 3u);
  EXPECT_EQ(PythonObject(12).ToString(), "12");
}

TEST(ObjectLiterals, UnsignedExtremes) {
  const std::uint64_t big = std::numeric_limits<std::uint64_t>::max();
  EXPECT_EQ(PythonObject(big).As<std::uint64_t>(), big);
  EXPECT_EQ(PythonObject(big).ReprString(), "18446744073709551615");
}

TEST(ObjectLiterals, ConversionChecks) {
  EXPECT_THROW(PythonObject(300).As<std::int8_t>(), exceptions::PythonError);
  EXPECT_THROW(PythonObject(-1).As<unsigned>(), exceptions::PythonError);
  EXPECT_THROW(PythonObject(1).As<std::string>(), exceptions::TypeMismatchError);
  EXPECT_THROW(PythonObject("1").As<int>(), exceptions::TypeMismatchError);
  EXPECT_THROW(PythonObject(1).As<bool>(), exceptions::TypeMismatchError);
  EXPECT_DOUBLE_EQ(PythonObject(3).As<double>(), 3.0);
}

TEST(ObjectLiterals, NullHandleConvertsLikeNone) {
  runtime::Interpreter::Require();
  const PythonObject empty;
  try {
    (void)empty.As<bool>();
    FAIL() << "expected TypeMismatchError";
  } catch (const exceptions::TypeMismatchError& error) {
    EXPECT_EQ(std::string(error.what()), "expected 'bool' but received 'NoneType'");
  }
  try {
    (void)empty.As<std::vector<int>>();
    FAIL() << "expected PythonError";
  } catch (const exceptions::PythonError& error) {
    EXPECT_EQ(std::string(error.what()), "'NoneType' object is not iterable");
  }
  EXPECT_FALSE(empty.As<std::optional<int>>().has_value());
}

TEST(ObjectLiterals, Containers) {
  const PythonObject list(std::vector<int>{1, 2, 3});
  EXPECT_EQ(list.ReprString(), "[1, 2, 3]");
  EXPECT_EQ(list.As<std::vector<int>>(), (std::vector<int>{1, 2, 3}));

  const PythonObject dict(std::map<std::string, int>{{"a", 1}, {"b", 2}});
  EXPECT_EQ(dict.ReprString(), "{'a': 1, 'b': 2}");
  const auto back = dict.As<std::unordered_map<std::string, int>>();
  EXPECT_EQ(back.at("b"), 2);

  const PythonObject tuple(std::make_tuple(1, std::string("x"), 2.5));
  EXPECT_EQ(tuple.ReprString(), "(1, 'x', 2.5)");
  const auto unpacked = tuple.As<std::tuple<int, std::string, double>>();
  EXPECT_EQ(std::get<1>(unpacked), "x");
  EXPECT_THROW((tuple.As<std::tuple<int, std::string>>()), exceptions::TypeMismatchError);
}

TEST(ObjectLiterals, NestedContainers) {
  const std::vector<std::vector<int>> grid{{1, 2}, {3}};
  const PythonObject object(grid);
  EXPECT_EQ(object.ReprString(), "[[1, 2], [3]]");
  EXPECT_EQ(object.As<std::vector<std::vector<int>>>(), grid);
  // Any iterable converts to a vector.
  const PythonObject fromTuple = PythonObject::Tuple({4, 5});
  EXPECT_EQ(fromTuple.As<std::vector<int>>(), (std::vector<int>{4, 5}));
}

TEST(ObjectLiterals, OptionalMapsToNone) {
  const std::optional<int> none;
  EXPECT_TRUE(PythonObject(none).IsNone());
  EXPECT_EQ(PythonObject(std::optional<int>(5)).ToInt64(), 5);
  EXPECT_FALSE(PythonObject::None().As<std::optional<int>>().has_value());
  EXPECT_EQ(PythonObject(9).As<std::optional<int>>(), 9);
}

TEST(ObjectLiterals, UserTypeWithConversionMembers) {
  const Celsius warm{21.5};
  const PythonObject object(warm);
  EXPECT_DOUBLE_EQ(object.ToDouble(), 21.5);
  EXPECT_DOUBLE_EQ(object.As<Celsius>().degrees, 21.5);
  EXPECT_EQ(PythonObject::List({warm, 1}).ReprString(), "[21.5, 1]");
}

TEST(ObjectLiterals, StreamAndRepr) {
  std::ostringstream out;
  out << PythonObject("text") << ' ' << PythonObject(3);
  EXPECT_EQ(out.str(), "text 3");
  EXPECT_EQ(PythonObject("text").Repr().ToString(), "'text'");
  EXPECT_EQ(PythonObject::Dict({{"k", PythonObject::None()}}).ReprString(), "{'k': None}");
}
