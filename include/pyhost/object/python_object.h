/***
 * Name: pyhost::PythonObject
 * Purpose: Owning, reference-counted handle to one Python object, and the
 *   dynamic operation surface (attributes, items, calls, operators) over it.
 * Inputs:
 *   - Host literals (bool, integers, floats, strings, containers) or raw
 *     PyObject pointers obtained from the C API.
 * Outputs:
 *   - New PythonObject handles produced by dispatched operations.
 * Theory of Operation:
 *   - A non-null pointer is exactly one owned reference. Copy increments,
 *     move steals, and the destructor is the single place that decrements;
 *     it takes the GIL itself and does nothing once the interpreter is gone.
 *   - FromOwned adopts a new reference as-is; FromBorrowed increments first.
 *   - The null state is a valid empty value. Whenever it is handed to the
 *     interpreter (argument, container slot, return value) it becomes None,
 *     and dispatched operations on it act on None.
 *   - Operators with a direct C API entry point (attributes, items, call,
 *     len, hash, truth) use it. All other operators go through one
 *     primitive, InvokeMethod, which looks the dunder method up by name.
 *     A NotImplemented answer tries the reflected method on the other
 *     operand; == and != then fall back to identity.
 *   - In-place operators call the plain dunder and rebind the receiver.
 *   - Every operation except destruction requires the calling thread to
 *     hold the GIL (the thread that started the interpreter holds it).
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pyhost/object/slice.h"

namespace pyhost {

class PythonObject;
class PythonIterator;
struct Kwarg;

template <class T, class Enable = void>
struct Converter;

namespace detail {

template <class T, class = void>
struct HasToPythonMember : std::false_type {};

template <class T>
struct HasToPythonMember<T, std::void_t<decltype(std::declval<const T&>().ToPython())>>
    : std::is_same<decltype(std::declval<const T&>().ToPython()), PythonObject> {};

template <class T>
inline constexpr bool kIsIntegerLiteral =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>;

}  // namespace detail

enum class BinaryOperator {
  Add, Sub, Mul, TrueDiv, FloorDiv, Mod, Pow, MatMul,
  LShift, RShift, And, Or, Xor,
  Lt, Le, Gt, Ge, Eq, Ne,
};

enum class UnaryOperator { Neg, Pos, Invert };

class PythonObject {
 public:
  class Cursor;

  PythonObject() noexcept = default;
  PythonObject(std::nullptr_t) noexcept {}
  PythonObject(const PythonObject& other) noexcept;
  PythonObject(PythonObject&& other) noexcept;
  PythonObject& operator=(const PythonObject& other) noexcept;
  PythonObject& operator=(PythonObject&& other) noexcept;
  ~PythonObject();

  // Literal construction; each produces a new owned reference.
  PythonObject(bool value);
  PythonObject(char value) = delete;
  template <class I, std::enable_if_t<detail::kIsIntegerLiteral<I>, int> = 0>
  PythonObject(I value) : PythonObject(std::is_signed_v<I> ? FromSigned(static_cast<long long>(value))
                                                            : FromUnsigned(static_cast<unsigned long long>(value))) {}
  template <class F, std::enable_if_t<std::is_floating_point_v<F>, int> = 0>
  PythonObject(F value) : PythonObject(FromDouble(static_cast<double>(value))) {}
  PythonObject(const char* value);
  PythonObject(std::string_view value);
  PythonObject(const std::string& value);

  template <class T>
  PythonObject(const std::vector<T>& values) : PythonObject(Converter<std::vector<T>>::ToPython(values)) {}
  template <class K, class V>
  PythonObject(const std::map<K, V>& values) : PythonObject(Converter<std::map<K, V>>::ToPython(values)) {}
  template <class K, class V>
  PythonObject(const std::unordered_map<K, V>& values)
      : PythonObject(Converter<std::unordered_map<K, V>>::ToPython(values)) {}
  template <class... Ts>
  PythonObject(const std::tuple<Ts...>& values) : PythonObject(Converter<std::tuple<Ts...>>::ToPython(values)) {}
  template <class T>
  PythonObject(const std::optional<T>& value) : PythonObject(Converter<std::optional<T>>::ToPython(value)) {}

  // Any type providing `PythonObject ToPython() const`.
  template <class T, std::enable_if_t<detail::HasToPythonMember<T>::value, int> = 0>
  PythonObject(const T& value) : PythonObject(value.ToPython()) {}

  // Ownership-explicit construction from raw pointers.
  static PythonObject FromOwned(PyObject* owned) noexcept;
  static PythonObject FromBorrowed(PyObject* borrowed) noexcept;

  static PythonObject None();
  static PythonObject List(std::initializer_list<PythonObject> items = {});
  static PythonObject ListFrom(const std::vector<PythonObject>& items);
  static PythonObject Tuple(std::initializer_list<PythonObject> items = {});
  static PythonObject TupleFrom(const std::vector<PythonObject>& items);
  static PythonObject Dict(std::initializer_list<std::pair<PythonObject, PythonObject>> items = {});

  // Raw access.
  PyObject* Get() const noexcept { return ptr_; }
  PyObject* NewReference() const noexcept;
  PyObject* Release() noexcept { return std::exchange(ptr_, nullptr); }
  PyObject* IntoPython() && noexcept;
  Py_ssize_t RefCount() const noexcept { return ptr_ != nullptr ? Py_REFCNT(ptr_) : 0; }
  bool IsNull() const noexcept { return ptr_ == nullptr; }
  bool IsNone() const noexcept { return ptr_ == nullptr || ptr_ == Py_None; }
  bool Is(const PythonObject& other) const noexcept { return target() == other.target(); }
  std::string TypeName() const;

  // Conversions.
  PythonObject Str() const;
  PythonObject Repr() const;
  std::string ToString() const;
  std::string ReprString() const;
  std::int64_t ToInt64() const;
  double ToDouble() const;
  bool ToBool() const;
  explicit operator bool() const { return ToBool(); }
  template <class T>
  T As() const;

  // Attributes.
  PythonObject Attr(std::string_view name) const;
  void SetAttr(std::string_view name, const PythonObject& value);
  bool HasAttr(std::string_view name) const;
  void DelAttr(std::string_view name);

  // Items. Several keys are packed into one tuple, like obj[a, b].
  PythonObject GetItem(const PythonObject& key) const;
  PythonObject GetItem(const std::vector<PythonObject>& keys) const;
  PythonObject GetItem(const Slice& slice) const;
  PythonObject GetItem(const std::vector<Slice>& slices) const;
  PythonObject operator[](const PythonObject& key) const { return GetItem(key); }
  void SetItem(const PythonObject& key, const PythonObject& value);
  void SetItem(const std::vector<PythonObject>& keys, const PythonObject& value);
  void SetItem(const Slice& slice, const PythonObject& value);
  void DelItem(const PythonObject& key);

  // Calls.
  PythonObject Call(const std::vector<PythonObject>& args, const std::vector<Kwarg>& kwargs) const;
  PythonObject Call(const std::vector<PythonObject>& args = {}) const;
  template <class... Args>
  PythonObject operator()(Args&&... args) const;
  template <class... Args>
  PythonObject CallMethod(std::string_view name, Args&&... args) const {
    return Attr(name)(std::forward<Args>(args)...);
  }
  // Look up a method by name on this object and call it with positional args.
  PythonObject InvokeMethod(std::string_view name, const std::vector<PythonObject>& args = {}) const;

  // Protocols.
  std::size_t Len() const;
  std::size_t Hash() const noexcept;
  bool Contains(const PythonObject& item) const;
  PythonIterator Iter() const;
  Cursor begin() const;
  std::default_sentinel_t end() const noexcept { return {}; }

  // Operator dispatch.
  PythonObject BinaryDispatch(BinaryOperator op, const PythonObject& rhs) const;
  PythonObject ReflectedDispatch(BinaryOperator op, const PythonObject& lhs) const;
  PythonObject UnaryDispatch(UnaryOperator op) const;

  PythonObject operator+(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Add, rhs); }
  PythonObject operator-(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Sub, rhs); }
  PythonObject operator*(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Mul, rhs); }
  PythonObject operator/(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::TrueDiv, rhs); }
  PythonObject operator%(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Mod, rhs); }
  PythonObject operator<<(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::LShift, rhs); }
  PythonObject operator>>(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::RShift, rhs); }
  PythonObject operator&(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::And, rhs); }
  PythonObject operator|(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Or, rhs); }
  PythonObject operator^(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Xor, rhs); }
  PythonObject FloorDiv(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::FloorDiv, rhs); }
  PythonObject Pow(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Pow, rhs); }
  PythonObject MatMul(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::MatMul, rhs); }

  PythonObject operator-() const { return UnaryDispatch(UnaryOperator::Neg); }
  PythonObject operator+() const { return UnaryDispatch(UnaryOperator::Pos); }
  PythonObject operator~() const { return UnaryDispatch(UnaryOperator::Invert); }

  PythonObject& operator+=(const PythonObject& rhs) { return rebind(BinaryOperator::Add, rhs); }
  PythonObject& operator-=(const PythonObject& rhs) { return rebind(BinaryOperator::Sub, rhs); }
  PythonObject& operator*=(const PythonObject& rhs) { return rebind(BinaryOperator::Mul, rhs); }
  PythonObject& operator/=(const PythonObject& rhs) { return rebind(BinaryOperator::TrueDiv, rhs); }
  PythonObject& operator%=(const PythonObject& rhs) { return rebind(BinaryOperator::Mod, rhs); }
  PythonObject& operator<<=(const PythonObject& rhs) { return rebind(BinaryOperator::LShift, rhs); }
  PythonObject& operator>>=(const PythonObject& rhs) { return rebind(BinaryOperator::RShift, rhs); }
  PythonObject& operator&=(const PythonObject& rhs) { return rebind(BinaryOperator::And, rhs); }
  PythonObject& operator|=(const PythonObject& rhs) { return rebind(BinaryOperator::Or, rhs); }
  PythonObject& operator^=(const PythonObject& rhs) { return rebind(BinaryOperator::Xor, rhs); }

  // Rich comparisons return whatever the dunder returned.
  PythonObject operator<(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Lt, rhs); }
  PythonObject operator<=(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Le, rhs); }
  PythonObject operator>(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Gt, rhs); }
  PythonObject operator>=(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Ge, rhs); }
  PythonObject Eq(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Eq, rhs); }
  PythonObject Ne(const PythonObject& rhs) const { return BinaryDispatch(BinaryOperator::Ne, rhs); }

  // Total equality for host containers: a failing __eq__/__ne__ is a
  // programming error and trips a debug assertion instead of throwing.
  bool operator==(const PythonObject& rhs) const noexcept;
  bool operator!=(const PythonObject& rhs) const noexcept;

 private:
  static PythonObject FromSigned(long long value);
  static PythonObject FromUnsigned(unsigned long long value);
  static PythonObject FromDouble(double value);

  PyObject* target() const noexcept { return ptr_ != nullptr ? ptr_ : Py_None; }
  PythonObject tryMethod(const char* name, const PythonObject& arg) const;
  PythonObject& rebind(BinaryOperator op, const PythonObject& rhs);
  void reset() noexcept;

  PyObject* ptr_{nullptr};
};

// Keyword argument for PythonObject::operator() and CallMethod.
struct Kwarg {
  std::string name;
  PythonObject value;
};

std::ostream& operator<<(std::ostream& out, const PythonObject& object);

namespace detail {

template <class T>
inline constexpr bool kIsNativeOperand =
    !std::is_same_v<std::decay_t<T>, PythonObject> &&
    (std::is_arithmetic_v<std::decay_t<T>> || std::is_convertible_v<const T&, std::string_view>);

template <class Arg>
void CollectArg(std::vector<PythonObject>& positional, std::vector<Kwarg>& named, Arg&& arg) {
  if constexpr (std::is_same_v<std::decay_t<Arg>, Kwarg>) {
    named.emplace_back(std::forward<Arg>(arg));
  } else {
    positional.emplace_back(std::forward<Arg>(arg));
  }
}

}  // namespace detail

template <class... Args>
PythonObject PythonObject::operator()(Args&&... args) const {
  std::vector<PythonObject> positional;
  std::vector<Kwarg> named;
  positional.reserve(sizeof...(Args));
  (detail::CollectArg(positional, named, std::forward<Args>(args)), ...);
  return Call(positional, named);
}

// Native left operand: `2 * obj` dispatches obj.__rmul__(2) first.
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator+(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Add, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator-(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Sub, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator*(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Mul, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator/(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::TrueDiv, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator%(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Mod, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator&(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::And, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator|(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Or, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator^(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Xor, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator<(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Lt, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator<=(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Le, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator>(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Gt, PythonObject(lhs)); }
template <class T, std::enable_if_t<detail::kIsNativeOperand<T>, int> = 0>
PythonObject operator>=(const T& lhs, const PythonObject& rhs) { return rhs.ReflectedDispatch(BinaryOperator::Ge, PythonObject(lhs)); }

}  // namespace pyhost

namespace std {

template <>
struct hash<pyhost::PythonObject> {
  std::size_t operator()(const pyhost::PythonObject& object) const noexcept { return object.Hash(); }
};

}  // namespace std

#include "pyhost/object/python_iterator.h"
#include "pyhost/object/converter.h"
