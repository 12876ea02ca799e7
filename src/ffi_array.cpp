// ------------------------------
// License
//
// Copyright 2024 Aldrin Montana
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


// ------------------------------
// Dependencies

#include "ipcmap/ffi_array.hpp"


namespace ipcmap {

  // >> ArrowArrayHolder implementations

  ArrowArrayHolder::ArrowArrayHolder(ArrowArray* array) {
    array_ = *array;
    ArrowArrayMarkReleased(array);
  }

  ArrowArrayHolder::ArrowArrayHolder(ArrowArrayHolder&& other) noexcept {
    array_ = other.array_;
    ArrowArrayMarkReleased(&other.array_);
  }

  ArrowArrayHolder& ArrowArrayHolder::operator=(ArrowArrayHolder&& other) noexcept {
    if (this != &other) {
      Reset();
      array_ = other.array_;
      ArrowArrayMarkReleased(&other.array_);
    }

    return *this;
  }

  ArrowArrayHolder::~ArrowArrayHolder() { Reset(); }

  void ArrowArrayHolder::MoveTo(ArrowArray* out) {
    *out = array_;
    ArrowArrayMarkReleased(&array_);
  }

  ArrowArray* ArrowArrayHolder::Detach() {
    auto heap_array = new ArrowArray;
    MoveTo(heap_array);

    return heap_array;
  }

  void ArrowArrayHolder::Reset() { ArrowArrayRelease(&array_); }

} // namespace: ipcmap
