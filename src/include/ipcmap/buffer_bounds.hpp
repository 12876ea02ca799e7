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
#include <string>

// >> Arrow dependencies
#include "arrow/buffer.h"
#include "arrow/result.h"
#include "arrow/status.h"

#include "ipcmap/ipc_types.hpp"
#include "ipcmap/status.hpp"


namespace ipcmap {

  //! A validated (offset, length) pair; both are known to be non-negative
  struct BufferBounds {
    int64_t offset;
    int64_t length;
  };

  //! Pops the next buffer descriptor and checks it for negative values
  arrow::Result<BufferBounds> GetBufferBounds(IpcBufferQueue& buffers);

  //! Resolves `bounds` against `data`, starting at `block_offset`
  arrow::Result<const uint8_t*>
  GetBytes( const arrow::Buffer& data
           ,int64_t              block_offset
           ,const BufferBounds&  bounds);

  //! Converts a footer value into a length, failing on negatives
  arrow::Result<int64_t> FooterLength(int64_t value, const char* what);

  /**
   * Pops the next descriptor and resolves it as a buffer of `T` holding at least
   * `min_count` elements. The bytes must be a whole number of `T` and suitably
   * aligned for it, as they are handed out for reinterpretation as `T`.
   */
  template <typename T>
  arrow::Result<const uint8_t*>
  GetBuffer( const arrow::Buffer& data
            ,int64_t              block_offset
            ,IpcBufferQueue&      buffers
            ,int64_t              min_count) {
    ARROW_ASSIGN_OR_RAISE(auto bounds, GetBufferBounds(buffers));
    ARROW_ASSIGN_OR_RAISE(auto values, GetBytes(data, block_offset, bounds));

    const auto address = reinterpret_cast<uintptr_t>(values);
    if (bounds.length % static_cast<int64_t>(sizeof(T)) != 0 or address % alignof(T) != 0) {
      return OutOfSpec(
         OutOfSpecKind::kMisaligned
        ,"buffer not aligned for mmap: " + std::to_string(bounds.length)
           + " bytes at offset " + std::to_string(bounds.offset)
           + " for elements of width " + std::to_string(sizeof(T))
      );
    }

    const int64_t count = bounds.length / static_cast<int64_t>(sizeof(T));
    if (count < min_count) {
      return OutOfSpec(
         OutOfSpecKind::kTooSmall
        ,"buffer's length is too small in mmap: " + std::to_string(count)
           + " elements, expected at least " + std::to_string(min_count)
      );
    }

    return values;
  }

  //! Pops the validity descriptor. The bytes are only resolved when there are nulls;
  //  otherwise the result is null.
  arrow::Result<const uint8_t*>
  GetValidity( const arrow::Buffer& data
              ,int64_t              block_offset
              ,IpcBufferQueue&      buffers
              ,int64_t              null_count);

} // namespace ipcmap
