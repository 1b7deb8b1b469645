/***
 * Name: pyhost::PythonIterator
 * Purpose: Adapt Python's iterator protocol to a has-more / next interface.
 * Inputs: A Python iterator object (the result of iter(x))
 * Outputs: Elements as PythonObject, one per Next() call
 * Theory of Operation:
 *   Python's __next__ answers "next element or StopIteration" in one call,
 *   while host loops ask "is there more" before "give it to me". The adapter
 *   therefore keeps one element buffered: construction pulls the first one,
 *   and every Next() hands out the buffered element and pulls the following
 *   one. State is Ready while an element is buffered and Exhausted once a
 *   pull came back empty; the last real element is still returned by the
 *   Next() that caused the transition.
 *   An error raised by a pull is held back until the element buffered
 *   before it has been handed out: HasMore() stays true while the error is
 *   pending and the following Next() throws it, after which the adapter is
 *   Exhausted.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

#include "pyhost/exceptions/python_error.h"
#include "pyhost/object/python_object.h"

namespace pyhost {

class PythonIterator {
 public:
  explicit PythonIterator(PythonObject iterator);

  bool HasMore() const noexcept { return state_ == State::Ready || pending_.has_value(); }
  PythonObject Next();

 private:
  enum class State { Ready, Exhausted };

  void pull();

  PythonObject iterator_;
  PythonObject buffered_{};
  State state_{State::Exhausted};
  std::optional<exceptions::PythonError> pending_{};
};

// Input iterator driving a PythonIterator, for range-based for loops over
// any iterable PythonObject.
class PythonObject::Cursor {
 public:
  using iterator_category = std::input_iterator_tag;
  using value_type = PythonObject;
  using difference_type = std::ptrdiff_t;
  using pointer = const PythonObject*;
  using reference = const PythonObject&;

  Cursor() = default;
  explicit Cursor(std::shared_ptr<PythonIterator> source);

  reference operator*() const { return current_; }
  pointer operator->() const { return &current_; }
  Cursor& operator++() {
    advance();
    return *this;
  }
  void operator++(int) { advance(); }
  bool operator==(std::default_sentinel_t) const noexcept { return done_; }

 private:
  void advance();

  std::shared_ptr<PythonIterator> source_{};
  PythonObject current_{};
  bool done_{true};
};

}  // namespace pyhost
