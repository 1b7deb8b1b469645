/***
 * Name: test_type_builder
 * Purpose: Native types exposed through TypeBuilder construct, print,
 *   dispatch methods and destroy their payloads like Python classes.
 */
#include <gtest/gtest.h>

#include <string>

#include "pyhost/bindings/module_builder.h"
#include "pyhost/bindings/type_builder.h"
#include "pyhost/exceptions/internal_error.h"
#include "pyhost/exceptions/python_error.h"
#include "pyhost/exceptions/type_mismatch_error.h"
#include "pyhost/python.h"

using namespace pyhost;

namespace {

struct Point {
  int x{0};
  int y{0};

  std::string Repr() const { return "Point(" + std::to_string(x) + ", " + std::to_string(y) + ")"; }

  PythonObject Translate(const PythonObject& args) {
    bindings::CheckArity(args, 2, "translate");
    x += args[0].As<int>();
    y += args[1].As<int>();
    return {};
  }
};

struct Tracked {
  static inline int live = 0;

  Tracked() { ++live; }
  Tracked(const Tracked&) { ++live; }
  Tracked(Tracked&&) noexcept { ++live; }
  Tracked& operator=(const Tracked&) = default;
  Tracked& operator=(Tracked&&) noexcept = default;
  ~Tracked() { --live; }

  std::string Repr() const { return "Tracked()"; }
};

struct Counter {
  std::string Repr() const { return "Counter()"; }
};

struct Moody {
  static inline bool refuseConstruction = false;

  Moody() {
    if (refuseConstruction) { throw 7; }
  }

  std::string Repr() const { throw 7; }
};

struct GeometryTypes {
  TypedPythonObject<shape::Type> point;
  TypedPythonObject<shape::Type> tracked;
};

const GeometryTypes& geometry() {
  static const GeometryTypes types = [] {
    bindings::ModuleBuilder module("pyhost_geometry", "Geometry value types");
    auto point = module.AddType<Point>("Point", "A 2D point");
    point.DefMethod<&Point::Translate>("translate", "Move by (dx, dy)");
    auto tracked = module.AddType<Tracked>("Tracked");
    GeometryTypes made{point.Finalize(), tracked.Finalize()};
    module.Finalize();
    return made;
  }();
  return types;
}

std::string raisedMessage(const PythonObject& callable, const PythonObject& arg) {
  try {
    callable(arg);
  } catch (const exceptions::PythonError& error) {
    return error.what();
  }
  return "<no error>";
}

}  // namespace

TEST(BindingsTypeBuilder, DefaultConstructsAndPrints) {
  const PythonObject point = geometry().point.Object()();
  EXPECT_EQ(point.ReprString(), "Point(0, 0)");
  EXPECT_EQ(point.ToString(), "Point(0, 0)");
  EXPECT_EQ(point.TypeName(), "pyhost_geometry.Point");
  EXPECT_TRUE(geometry().point.IsInstance(point));
}

TEST(BindingsTypeBuilder, MethodsMutateThePayload) {
  const PythonObject point = geometry().point.Object()();
  EXPECT_TRUE(point.CallMethod("translate", 2, 3).IsNone());
  EXPECT_EQ(point.ReprString(), "Point(2, 3)");
  EXPECT_EQ(bindings::UnboxChecked<Point>(point).x, 2);

  bindings::Unbox<Point>(point).y = 9;
  EXPECT_EQ(point.ReprString(), "Point(2, 9)");
}

TEST(BindingsTypeBuilder, MethodArityErrorsBecomeTypeError) {
  const PythonObject point = geometry().point.Object()();
  try {
    point.CallMethod("translate", 1);
    FAIL() << "expected PythonError";
  } catch (const exceptions::PythonError& error) {
    EXPECT_EQ(std::string(error.what()), "translate() takes exactly 2 arguments (1 given)");
  }
  // A bad argument type is reported through the same channel.
  EXPECT_THROW(point.CallMethod("translate", "a", 1), exceptions::PythonError);
  EXPECT_EQ(point.ReprString(), "Point(0, 0)");
}

TEST(BindingsTypeBuilder, ConstructorTakesNoArguments) {
  const PythonObject type = geometry().point.Object();
  EXPECT_EQ(raisedMessage(type, PythonObject(1)), "Point() takes no arguments (1 given)");
  try {
    type(Kwarg{"x", 1});
    FAIL() << "expected PythonError";
  } catch (const exceptions::PythonError& error) {
    EXPECT_EQ(std::string(error.what()), "Point() takes no arguments (1 given)");
  }
}

TEST(BindingsTypeBuilder, PayloadLifetimeFollowsTheObject) {
  const PythonObject type = geometry().tracked.Object();
  const int before = Tracked::live;
  {
    const PythonObject first = type();
    const PythonObject alias = first;
    EXPECT_EQ(Tracked::live, before + 1);
  }
  EXPECT_EQ(Tracked::live, before);

  // __init__ failed after __new__ built the payload: it is still destroyed.
  EXPECT_THROW(type(1), exceptions::PythonError);
  EXPECT_EQ(Tracked::live, before);
}

TEST(BindingsTypeBuilder, ReinitResetsThePayload) {
  const PythonObject point = geometry().point.Object()();
  point.CallMethod("translate", 4, 4);
  point.CallMethod("__init__");
  EXPECT_EQ(point.ReprString(), "Point(0, 0)");
}

TEST(BindingsTypeBuilder, PublishedInItsModule) {
  const PythonObject module = python::ImportModule("pyhost_geometry").Object();
  EXPECT_TRUE(module.Attr("Point").Is(geometry().point.Object()));
  EXPECT_EQ(geometry().point.Name(), "pyhost_geometry.Point");
  EXPECT_EQ(geometry().point->Attr("__name__").ToString(), "Point");
  EXPECT_EQ(geometry().point->Attr("__module__").ToString(), "pyhost_geometry");
  EXPECT_EQ(geometry().point->Attr("__doc__").ToString(), "A 2D point");
  EXPECT_EQ(module.Attr("Point").Attr("translate").Attr("__doc__").ToString(), "Move by (dx, dy)");

  const PythonObject moved = python::Evaluate(
      "__import__('pyhost_geometry').Point().translate(1, 1)");
  EXPECT_TRUE(moved.IsNone());
}

TEST(BindingsTypeBuilder, UnboxCheckedRejectsOtherTypes) {
  (void)geometry();
  EXPECT_THROW(bindings::UnboxChecked<Point>(PythonObject(1)), exceptions::TypeMismatchError);
  const PythonObject tracked = geometry().tracked.Object()();
  EXPECT_THROW(bindings::UnboxChecked<Point>(tracked), exceptions::TypeMismatchError);
}

TEST(BindingsTypeBuilder, FinalizeTwiceThrows) {
  bindings::TypeBuilder<Counter> builder("pyhost_scratch.Counter");
  const auto type = builder.Finalize();
  EXPECT_EQ(type.Name(), "pyhost_scratch.Counter");
  EXPECT_THROW(builder.Finalize(), exceptions::InternalError);
}

TEST(BindingsTypeBuilder, NonStandardThrowsBecomeSystemError) {
  static const TypedPythonObject<shape::Type> moodyType = bindings::TypeBuilder<Moody>("pyhost_scratch.Moody").Finalize();
  const PythonObject type = moodyType.Object();
  const PythonObject moody = type();
  try {
    (void)moody.ReprString();
    FAIL() << "expected PythonError";
  } catch (const exceptions::PythonError& error) {
    EXPECT_EQ(std::string(error.what()), "unknown native exception");
  }

  Moody::refuseConstruction = true;
  EXPECT_THROW(type(), exceptions::PythonError);
  EXPECT_THROW(moody.CallMethod("__init__"), exceptions::PythonError);
  Moody::refuseConstruction = false;

  const PythonObject ns = python::Evaluate(
      "def raised_by_repr(obj):\n"
      "    try:\n"
      "        repr(obj)\n"
      "    except SystemError:\n"
      "        return 'SystemError'\n"
      "    return 'nothing'\n",
      python::EvalMode::File);
  EXPECT_EQ(ns["raised_by_repr"](moody).ToString(), "SystemError");
}
