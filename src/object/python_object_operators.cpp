/***
 * Name: pyhost::PythonObject (operator dispatch)
 * Purpose: Arithmetic, bitwise, unary and comparison operators through
 *   method-name dispatch.
 * Inputs: Receiver and the other operand
 * Outputs: Whatever the dunder returned, as a new handle
 * Theory of Operation:
 *   Forward: lhs.__op__(rhs). A NotImplemented answer (or a missing dunder)
 *   moves on to rhs.__rop__(lhs); arithmetic skips that step when both
 *   operands share a type, comparisons never do. When rhs's type is a proper
 *   subclass of lhs's type and overrides __rop__, the two steps swap, as in
 *   CPython's binary operator protocol. Reflected dispatch (native
 *   left operand) runs the same two steps in the opposite order. When both
 *   steps decline, == and != compare identity and everything else raises
 *   PythonError with CPython's TypeError wording.
 */
#include "pyhost/object/python_object.h"

#include <cassert>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "pyhost/exceptions/python_error.h"
#include "pyhost/object/checked.h"
#include "pyhost/support/debug_log.h"

namespace pyhost {

namespace {

struct OperatorNames {
  const char* forward;
  const char* reflected;
  const char* symbol;
  bool comparison;
};

const OperatorNames& names_of(BinaryOperator op) {
  static const OperatorNames kAdd{"__add__", "__radd__", "+", false};
  static const OperatorNames kSub{"__sub__", "__rsub__", "-", false};
  static const OperatorNames kMul{"__mul__", "__rmul__", "*", false};
  static const OperatorNames kTrueDiv{"__truediv__", "__rtruediv__", "/", false};
  static const OperatorNames kFloorDiv{"__floordiv__", "__rfloordiv__", "//", false};
  static const OperatorNames kMod{"__mod__", "__rmod__", "%", false};
  static const OperatorNames kPow{"__pow__", "__rpow__", "** or pow()", false};
  static const OperatorNames kMatMul{"__matmul__", "__rmatmul__", "@", false};
  static const OperatorNames kLShift{"__lshift__", "__rlshift__", "<<", false};
  static const OperatorNames kRShift{"__rshift__", "__rrshift__", ">>", false};
  static const OperatorNames kAnd{"__and__", "__rand__", "&", false};
  static const OperatorNames kOr{"__or__", "__ror__", "|", false};
  static const OperatorNames kXor{"__xor__", "__rxor__", "^", false};
  static const OperatorNames kLt{"__lt__", "__gt__", "<", true};
  static const OperatorNames kLe{"__le__", "__ge__", "<=", true};
  static const OperatorNames kGt{"__gt__", "__lt__", ">", true};
  static const OperatorNames kGe{"__ge__", "__le__", ">=", true};
  static const OperatorNames kEq{"__eq__", "__eq__", "==", true};
  static const OperatorNames kNe{"__ne__", "__ne__", "!=", true};
  switch (op) {
    case BinaryOperator::Add: return kAdd;
    case BinaryOperator::Sub: return kSub;
    case BinaryOperator::Mul: return kMul;
    case BinaryOperator::TrueDiv: return kTrueDiv;
    case BinaryOperator::FloorDiv: return kFloorDiv;
    case BinaryOperator::Mod: return kMod;
    case BinaryOperator::Pow: return kPow;
    case BinaryOperator::MatMul: return kMatMul;
    case BinaryOperator::LShift: return kLShift;
    case BinaryOperator::RShift: return kRShift;
    case BinaryOperator::And: return kAnd;
    case BinaryOperator::Or: return kOr;
    case BinaryOperator::Xor: return kXor;
    case BinaryOperator::Lt: return kLt;
    case BinaryOperator::Le: return kLe;
    case BinaryOperator::Gt: return kGt;
    case BinaryOperator::Ge: return kGe;
    case BinaryOperator::Eq: return kEq;
    case BinaryOperator::Ne: return kNe;
  }
  return kAdd;
}

bool is_not_implemented(const PythonObject& result) { return result.Get() == Py_NotImplemented; }

// Both operands declined.
PythonObject decline(BinaryOperator op, const PythonObject& lhs, const PythonObject& rhs) {
  if (op == BinaryOperator::Eq) { return PythonObject(lhs.Is(rhs)); }
  if (op == BinaryOperator::Ne) { return PythonObject(!lhs.Is(rhs)); }
  const OperatorNames& names = names_of(op);
  if (names.comparison) {
    throw exceptions::PythonError(std::string("'") + names.symbol + "' not supported between instances of '" +
                                  lhs.TypeName() + "' and '" + rhs.TypeName() + "'");
  }
  throw exceptions::PythonError(std::string("unsupported operand type(s) for ") + names.symbol + ": '" +
                                lhs.TypeName() + "' and '" + rhs.TypeName() + "'");
}

// rhs's type is a proper subclass of lhs's type with its own `reflected`.
bool subclass_overrides(PyTypeObject* left, PyTypeObject* right, const char* reflected) {
  if (left == right || PyType_IsSubtype(right, left) == 0) { return false; }
  const PythonObject rightType = PythonObject::FromBorrowed(reinterpret_cast<PyObject*>(right));
  if (!rightType.HasAttr(reflected)) { return false; }
  const PythonObject leftType = PythonObject::FromBorrowed(reinterpret_cast<PyObject*>(left));
  if (!leftType.HasAttr(reflected)) { return true; }
  return !rightType.Attr(reflected).Is(leftType.Attr(reflected));
}

}  // namespace

PythonObject PythonObject::tryMethod(const char* name, const PythonObject& arg) const {
  if (!HasAttr(name)) { return FromBorrowed(Py_NotImplemented); }
  return InvokeMethod(name, {arg});
}

PythonObject PythonObject::BinaryDispatch(BinaryOperator op, const PythonObject& rhs) const {
  const OperatorNames& names = names_of(op);
  if (subclass_overrides(Py_TYPE(target()), Py_TYPE(rhs.target()), names.reflected)) {
    PythonObject result = rhs.tryMethod(names.reflected, *this);
    if (!is_not_implemented(result)) { return result; }
    result = tryMethod(names.forward, rhs);
    if (!is_not_implemented(result)) { return result; }
    return decline(op, *this, rhs);
  }
  PythonObject result = tryMethod(names.forward, rhs);
  if (!is_not_implemented(result)) { return result; }
  if (names.comparison || Py_TYPE(target()) != Py_TYPE(rhs.target())) {
    result = rhs.tryMethod(names.reflected, *this);
    if (!is_not_implemented(result)) { return result; }
  }
  return decline(op, *this, rhs);
}

PythonObject PythonObject::ReflectedDispatch(BinaryOperator op, const PythonObject& lhs) const {
  const OperatorNames& names = names_of(op);
  PythonObject result = tryMethod(names.reflected, lhs);
  if (!is_not_implemented(result)) { return result; }
  result = lhs.tryMethod(names.forward, *this);
  if (!is_not_implemented(result)) { return result; }
  return decline(op, lhs, *this);
}

PythonObject PythonObject::UnaryDispatch(UnaryOperator op) const {
  const char* name = "__neg__";
  const char* symbol = "unary -";
  if (op == UnaryOperator::Pos) {
    name = "__pos__";
    symbol = "unary +";
  } else if (op == UnaryOperator::Invert) {
    name = "__invert__";
    symbol = "unary ~";
  }
  if (!HasAttr(name)) {
    throw exceptions::PythonError(std::string("bad operand type for ") + symbol + ": '" + TypeName() + "'");
  }
  return InvokeMethod(name);
}

PythonObject& PythonObject::rebind(BinaryOperator op, const PythonObject& rhs) {
  PythonObject result = BinaryDispatch(op, rhs);
  *this = std::move(result);
  return *this;
}

bool PythonObject::operator==(const PythonObject& rhs) const noexcept {
  try {
    return BinaryDispatch(BinaryOperator::Eq, rhs).ToBool();
  } catch (const std::exception& error) {
    PYHOST_DEBUG_LOG("__eq__ failed: %s", error.what());
    assert(false && "__eq__ raised");
    PyErr_Clear();
    return false;
  }
}

bool PythonObject::operator!=(const PythonObject& rhs) const noexcept {
  try {
    return BinaryDispatch(BinaryOperator::Ne, rhs).ToBool();
  } catch (const std::exception& error) {
    PYHOST_DEBUG_LOG("__ne__ failed: %s", error.what());
    assert(false && "__ne__ raised");
    PyErr_Clear();
    return false;
  }
}

std::size_t PythonObject::Len() const {
  const Py_ssize_t size = PyObject_Size(target());
  if (size < 0) { detail::ThrowPendingError("PyObject_Size"); }
  return static_cast<std::size_t>(size);
}

std::size_t PythonObject::Hash() const noexcept {
  const Py_hash_t hash = PyObject_Hash(target());
  if (hash == -1) {
    assert(PyErr_Occurred() == nullptr && "__hash__ raised");
    PyErr_Clear();
    return 0;
  }
  return static_cast<std::size_t>(hash);
}

bool PythonObject::Contains(const PythonObject& item) const {
  if (HasAttr("__contains__")) { return InvokeMethod("__contains__", {item}).ToBool(); }
  PythonIterator iterator = Iter();
  while (iterator.HasMore()) {
    if (iterator.Next().Eq(item).ToBool()) { return true; }
  }
  return false;
}

PythonIterator PythonObject::Iter() const {
  return PythonIterator(detail::Checked(PyObject_GetIter(target()), "PyObject_GetIter"));
}

PythonObject::Cursor PythonObject::begin() const { return Cursor(std::make_shared<PythonIterator>(Iter())); }

}  // namespace pyhost
