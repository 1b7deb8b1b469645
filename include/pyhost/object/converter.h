/***
 * Name: pyhost::Converter
 * Purpose: The convertibility capability between host values and Python objects.
 * Inputs: Host values (ToPython) or PythonObject handles (FromPython)
 * Outputs: New owned PythonObject handles, or host values
 * Theory of Operation:
 *   - Converter<T>::ToPython(const T&) always produces a new reference.
 *   - Converter<T>::FromPython(const PythonObject&) may fail and throws
 *     TypeMismatchError when the object has the wrong Python type, or
 *     PythonError when the interpreter rejects the conversion (overflow).
 *   - The primary template forwards to members, so a user type opts in by
 *     providing `PythonObject ToPython() const` and
 *     `static T FromPython(const PythonObject&)`.
 *   - Specializations cover bool, integers, floating point, strings,
 *     vector (list), map/unordered_map (dict), tuple and optional (None).
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pyhost/object/python_object.h"

namespace pyhost {

namespace detail {

// Throws TypeMismatchError("expected '<expected>' but received '<actual>'").
[[noreturn]] void ThrowConversionMismatch(const char* expected, const PythonObject& actual);

// Throws PythonError for a value outside the target integer range.
[[noreturn]] void ThrowIntegerOverflow(const char* target);

// Throws the pending Python error as PythonError (InternalError if none is pending).
[[noreturn]] void ThrowPendingError(const char* context);

}  // namespace detail

template <class T, class Enable>
struct Converter {
  static PythonObject ToPython(const T& value) { return value.ToPython(); }
  static T FromPython(const PythonObject& object) { return T::FromPython(object); }
};

template <>
struct Converter<PythonObject> {
  static PythonObject ToPython(const PythonObject& value) { return value; }
  static PythonObject FromPython(const PythonObject& object) { return object; }
};

template <>
struct Converter<bool> {
  static PythonObject ToPython(bool value) { return PythonObject(value); }
  static bool FromPython(const PythonObject& object) {
    if (object.IsNull() || PyBool_Check(object.Get()) == 0) { detail::ThrowConversionMismatch("bool", object); }
    return object.Get() == Py_True;
  }
};

template <class I>
struct Converter<I, std::enable_if_t<detail::kIsIntegerLiteral<I>>> {
  static PythonObject ToPython(I value) { return PythonObject(value); }
  static I FromPython(const PythonObject& object) {
    if (object.IsNull() || PyLong_Check(object.Get()) == 0) { detail::ThrowConversionMismatch("int", object); }
    if constexpr (std::is_signed_v<I>) {
      const long long value = PyLong_AsLongLong(object.Get());
      if (value == -1 && PyErr_Occurred() != nullptr) { detail::ThrowPendingError("int conversion"); }
      if (value < static_cast<long long>(std::numeric_limits<I>::min()) ||
          value > static_cast<long long>(std::numeric_limits<I>::max())) {
        detail::ThrowIntegerOverflow("signed integer");
      }
      return static_cast<I>(value);
    } else {
      const unsigned long long value = PyLong_AsUnsignedLongLong(object.Get());
      if (value == static_cast<unsigned long long>(-1) && PyErr_Occurred() != nullptr) {
        detail::ThrowPendingError("int conversion");
      }
      if (value > static_cast<unsigned long long>(std::numeric_limits<I>::max())) {
        detail::ThrowIntegerOverflow("unsigned integer");
      }
      return static_cast<I>(value);
    }
  }
};

template <class F>
struct Converter<F, std::enable_if_t<std::is_floating_point_v<F>>> {
  static PythonObject ToPython(F value) { return PythonObject(value); }
  static F FromPython(const PythonObject& object) {
    if (object.IsNull() || (PyFloat_Check(object.Get()) == 0 && PyLong_Check(object.Get()) == 0)) {
      detail::ThrowConversionMismatch("float", object);
    }
    return static_cast<F>(object.ToDouble());
  }
};

template <>
struct Converter<std::string> {
  static PythonObject ToPython(const std::string& value) { return PythonObject(value); }
  static std::string FromPython(const PythonObject& object) {
    if (object.IsNull() || PyUnicode_Check(object.Get()) == 0) { detail::ThrowConversionMismatch("str", object); }
    return object.ToString();
  }
};

template <>
struct Converter<std::string_view> {
  static PythonObject ToPython(std::string_view value) { return PythonObject(value); }
};

template <>
struct Converter<const char*> {
  static PythonObject ToPython(const char* value) { return PythonObject(value); }
};

template <class T>
struct Converter<std::optional<T>> {
  static PythonObject ToPython(const std::optional<T>& value) {
    if (!value) { return PythonObject::None(); }
    return Converter<T>::ToPython(*value);
  }
  static std::optional<T> FromPython(const PythonObject& object) {
    if (object.IsNone()) { return std::nullopt; }
    return Converter<T>::FromPython(object);
  }
};

template <class T>
struct Converter<std::vector<T>> {
  static PythonObject ToPython(const std::vector<T>& values) {
    std::vector<PythonObject> items;
    items.reserve(values.size());
    for (const auto& value : values) { items.push_back(Converter<T>::ToPython(value)); }
    return PythonObject::ListFrom(items);
  }
  // Accepts any iterable.
  static std::vector<T> FromPython(const PythonObject& object) {
    PythonObject iterator = PythonObject::FromOwned(PyObject_GetIter(object.IsNull() ? Py_None : object.Get()));
    if (iterator.IsNull()) { detail::ThrowPendingError("iter()"); }
    std::vector<T> out;
    while (PyObject* item = PyIter_Next(iterator.Get())) {
      out.push_back(Converter<T>::FromPython(PythonObject::FromOwned(item)));
    }
    if (PyErr_Occurred() != nullptr) { detail::ThrowPendingError("iteration"); }
    return out;
  }
};

namespace detail {

template <class Map>
struct DictConverter {
  using Key = typename Map::key_type;
  using Mapped = typename Map::mapped_type;

  static PythonObject ToPython(const Map& values) {
    PythonObject dict = PythonObject::Dict();
    for (const auto& [key, value] : values) {
      dict.SetItem(Converter<Key>::ToPython(key), Converter<Mapped>::ToPython(value));
    }
    return dict;
  }
  static Map FromPython(const PythonObject& object) {
    if (object.IsNull() || PyDict_Check(object.Get()) == 0) { ThrowConversionMismatch("dict", object); }
    Map out;
    PyObject* key = nullptr;
    PyObject* value = nullptr;
    Py_ssize_t pos = 0;
    while (PyDict_Next(object.Get(), &pos, &key, &value) != 0) {
      out.emplace(Converter<Key>::FromPython(PythonObject::FromBorrowed(key)),
                  Converter<Mapped>::FromPython(PythonObject::FromBorrowed(value)));
    }
    return out;
  }
};

}  // namespace detail

template <class K, class V>
struct Converter<std::map<K, V>> : detail::DictConverter<std::map<K, V>> {};

template <class K, class V>
struct Converter<std::unordered_map<K, V>> : detail::DictConverter<std::unordered_map<K, V>> {};

template <class... Ts>
struct Converter<std::tuple<Ts...>> {
  static PythonObject ToPython(const std::tuple<Ts...>& values) {
    return std::apply(
        [](const auto&... items) {
          return PythonObject::TupleFrom({Converter<std::decay_t<decltype(items)>>::ToPython(items)...});
        },
        values);
  }
  static std::tuple<Ts...> FromPython(const PythonObject& object) {
    if (object.IsNull() || PyTuple_Check(object.Get()) == 0) { detail::ThrowConversionMismatch("tuple", object); }
    if (PyTuple_GET_SIZE(object.Get()) != static_cast<Py_ssize_t>(sizeof...(Ts))) {
      detail::ThrowConversionMismatch("tuple of matching length", object);
    }
    return fromItems(object, std::index_sequence_for<Ts...>{});
  }

 private:
  template <std::size_t... I>
  static std::tuple<Ts...> fromItems(const PythonObject& object, std::index_sequence<I...>) {
    return std::tuple<Ts...>(
        Converter<Ts>::FromPython(PythonObject::FromBorrowed(PyTuple_GET_ITEM(object.Get(), I)))...);
  }
};

template <class T>
PythonObject ToPython(const T& value) {
  return Converter<T>::ToPython(value);
}

template <class T>
T FromPython(const PythonObject& object) {
  return Converter<T>::FromPython(object);
}

template <class T>
T PythonObject::As() const {
  return Converter<T>::FromPython(*this);
}

}  // namespace pyhost
