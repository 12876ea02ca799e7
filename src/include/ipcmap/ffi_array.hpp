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

#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

// >> Arrow dependencies
#include "arrow/c/abi.h"
#include "arrow/c/helpers.h"


namespace ipcmap {

  //! Owns one ArrowArray and releases it on destruction, unless it was moved out.
  class ArrowArrayHolder {
    public:
      ArrowArrayHolder() { ArrowArrayMarkReleased(&array_); }

      //! Takes over `array`, leaving it marked released
      explicit ArrowArrayHolder(ArrowArray* array);

      ArrowArrayHolder(ArrowArrayHolder&& other) noexcept;
      ArrowArrayHolder& operator=(ArrowArrayHolder&& other) noexcept;

      ArrowArrayHolder(const ArrowArrayHolder&)            = delete;
      ArrowArrayHolder& operator=(const ArrowArrayHolder&) = delete;

      ~ArrowArrayHolder();

      bool              is_released() const { return ArrowArrayIsReleased(&array_); }
      ArrowArray*       get()               { return &array_; }
      const ArrowArray* get()         const { return &array_; }
      ArrowArray*       operator->()        { return &array_; }
      const ArrowArray* operator->()  const { return &array_; }

      //! Moves the array into `out`; this holder is released afterwards
      void MoveTo(ArrowArray* out);

      //! Moves the array to a new heap allocation owned by the caller
      ArrowArray* Detach();

      //! Calls the release callback now, if the array is still live
      void Reset();

    private:
      ArrowArray array_;
  };


  //! Keeps the source bytes and the pointer arrays of one exported ArrowArray alive.
  //  Children and the dictionary are heap allocated and owned through these pointers.
  template <typename Owner>
  struct MappedPrivateData {
    std::shared_ptr<Owner>   owner;
    std::vector<const void*> buffers;
    std::vector<ArrowArray*> children;
    ArrowArray*              dictionary { nullptr };
  };


  //! Release callback installed by CreateFfiArray<Owner>
  template <typename Owner>
  void ReleaseMappedArray(ArrowArray* array) {
    if (array == nullptr or ArrowArrayIsReleased(array)) { return; }

    // dropping the payload drops this handle's reference to the source bytes
    std::unique_ptr<MappedPrivateData<Owner>> private_data {
      static_cast<MappedPrivateData<Owner>*>(array->private_data)
    };

    for (ArrowArray* child : private_data->children) {
      ArrowArrayRelease(child);
      delete child;
    }

    if (private_data->dictionary != nullptr) {
      ArrowArrayRelease(private_data->dictionary);
      delete private_data->dictionary;
    }

    array->release      = nullptr;
    array->private_data = nullptr;
  }


  /**
   * Assembles an ArrowArray over memory owned by `owner`. Buffer pointers are
   * exposed as given (null for absent slots). Each child, and the dictionary if
   * it is live, moves to the heap and into the new array's private payload.
   * The offset is always 0.
   */
  template <typename Owner>
  ArrowArrayHolder
  CreateFfiArray( std::shared_ptr<Owner>        owner
                 ,int64_t                       length
                 ,int64_t                       null_count
                 ,std::vector<const void*>      buffers
                 ,std::vector<ArrowArrayHolder> children
                 ,ArrowArrayHolder              dictionary) {
    auto private_data     = std::make_unique<MappedPrivateData<Owner>>();
    private_data->owner   = std::move(owner);
    private_data->buffers = std::move(buffers);

    private_data->children.reserve(children.size());
    for (auto& child : children) {
      private_data->children.push_back(child.Detach());
    }

    if (not dictionary.is_released()) {
      private_data->dictionary = dictionary.Detach();
    }

    ArrowArray array;
    array.length       = length;
    array.null_count   = null_count;
    array.offset       = 0;
    array.n_buffers    = static_cast<int64_t>(private_data->buffers.size());
    array.n_children   = static_cast<int64_t>(private_data->children.size());
    array.buffers      = private_data->buffers.data();
    array.children     = private_data->children.data();
    array.dictionary   = private_data->dictionary;
    array.release      = &ReleaseMappedArray<Owner>;
    array.private_data = private_data.release();

    return ArrowArrayHolder(&array);
  }

} // namespace ipcmap
