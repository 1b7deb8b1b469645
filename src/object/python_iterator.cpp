/***
 * Name: pyhost::PythonIterator / PythonObject::Cursor
 * Purpose: One-element lookahead over Python's iterator protocol.
 * Inputs: An object implementing __next__
 * Outputs: Elements in iteration order
 * Theory of Operation: pull() asks the iterator for one element and records
 *   whether it got one. End of iteration and a raised error both come back
 *   as null from PyIter_Next; only the latter leaves the indicator set, and
 *   that error is kept in pending_ for the next Next() call.
 */
#include "pyhost/object/python_iterator.h"

#include <memory>
#include <string>
#include <utility>

#include "pyhost/bridge/error_bridge.h"
#include "pyhost/exceptions/python_error.h"
#include "pyhost/exceptions/type_mismatch_error.h"

namespace pyhost {

PythonIterator::PythonIterator(PythonObject iterator) : iterator_(std::move(iterator)) {
  if (iterator_.IsNull() || PyIter_Check(iterator_.Get()) == 0) {
    throw exceptions::TypeMismatchError("expected 'iterator' but received '" + iterator_.TypeName() + "'");
  }
  pull();
}

void PythonIterator::pull() {
  PyObject* item = PyIter_Next(iterator_.Get());
  if (item == nullptr) {
    state_ = State::Exhausted;
    buffered_ = PythonObject();
    if (bridge::ErrorOccurred()) { pending_ = bridge::UnsafeGetError(); }
    return;
  }
  buffered_ = PythonObject::FromOwned(item);
  state_ = State::Ready;
}

PythonObject PythonIterator::Next() {
  if (state_ == State::Exhausted) {
    if (pending_) {
      exceptions::PythonError error = std::move(*pending_);
      pending_.reset();
      throw error;
    }
    throw exceptions::PythonError("iterator is exhausted");
  }
  PythonObject current = std::move(buffered_);
  pull();
  return current;
}

PythonObject::Cursor::Cursor(std::shared_ptr<PythonIterator> source) : source_(std::move(source)) { advance(); }

void PythonObject::Cursor::advance() {
  if (source_ == nullptr || !source_->HasMore()) {
    current_ = PythonObject();
    done_ = true;
    return;
  }
  current_ = source_->Next();
  done_ = false;
}

}  // namespace pyhost
