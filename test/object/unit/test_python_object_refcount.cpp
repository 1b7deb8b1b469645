/***
 * Name: test_python_object_refcount
 * Purpose: Handles own exactly one reference: copy adds one, destruction and
 *   reassignment drop one, move and release transfer without touching the count.
 */
#include <gtest/gtest.h>

#include <utility>

#include "pyhost/object/python_object.h"
#include "pyhost/runtime/interpreter.h"

using namespace pyhost;

TEST(ObjectRefcount, CopyIncrementsAndDropDecrements) {
  const PythonObject list = PythonObject::List({1, 2});
  const Py_ssize_t before = list.RefCount();
  {
    const PythonObject copy = list;
    EXPECT_EQ(list.RefCount(), before + 1);
    EXPECT_TRUE(copy.Is(list));
  }
  EXPECT_EQ(list.RefCount(), before);
}

TEST(ObjectRefcount, MoveLeavesSourceNull) {
  PythonObject list = PythonObject::List({1});
  const Py_ssize_t before = list.RefCount();
  PythonObject moved = std::move(list);
  EXPECT_TRUE(list.IsNull());  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(moved.RefCount(), before);
}

TEST(ObjectRefcount, AssignmentReleasesPreviousReference) {
  const PythonObject first = PythonObject::List();
  const PythonObject second = PythonObject::List();
  const Py_ssize_t firstBefore = first.RefCount();
  PythonObject handle = first;
  EXPECT_EQ(first.RefCount(), firstBefore + 1);
  handle = second;
  EXPECT_EQ(first.RefCount(), firstBefore);
  handle = handle;  // NOLINT(clang-diagnostic-self-assign-overloaded)
  EXPECT_TRUE(handle.Is(second));
}

TEST(ObjectRefcount, OwnedAndBorrowedConstruction) {
  const PythonObject anchor = PythonObject::List();
  PyObject* raw = anchor.Get();
  const Py_ssize_t before = Py_REFCNT(raw);
  {
    const PythonObject borrowed = PythonObject::FromBorrowed(raw);
    EXPECT_EQ(Py_REFCNT(raw), before + 1);
    const PythonObject owned = PythonObject::FromOwned(anchor.NewReference());
    EXPECT_EQ(Py_REFCNT(raw), before + 2);
  }
  EXPECT_EQ(Py_REFCNT(raw), before);
}

TEST(ObjectRefcount, ReleaseGivesUpOwnership) {
  PythonObject list = PythonObject::List();
  PyObject* raw = list.Release();
  EXPECT_TRUE(list.IsNull());
  EXPECT_EQ(Py_REFCNT(raw), 1);
  Py_DECREF(raw);
}

TEST(ObjectRefcount, NullBecomesNoneWhenHandedOut) {
  runtime::Interpreter::Require();
  PythonObject empty;
  EXPECT_TRUE(empty.IsNull());
  EXPECT_TRUE(empty.IsNone());
  EXPECT_EQ(empty.RefCount(), 0);

  PyObject* none = empty.NewReference();
  EXPECT_EQ(none, Py_None);
  Py_DECREF(none);

  PyObject* moved = std::move(empty).IntoPython();
  EXPECT_EQ(moved, Py_None);
  Py_DECREF(moved);

  const PythonObject list = PythonObject::List({PythonObject(), PythonObject(nullptr)});
  EXPECT_EQ(list.ReprString(), "[None, None]");
}

TEST(ObjectRefcount, NullDispatchesAsNone) {
  runtime::Interpreter::Require();
  const PythonObject empty;
  EXPECT_EQ(empty.TypeName(), "NoneType");
  EXPECT_EQ(empty.ReprString(), "None");
  EXPECT_FALSE(empty.ToBool());
  EXPECT_TRUE(empty.Is(PythonObject::None()));
}
