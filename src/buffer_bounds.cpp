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

#include "ipcmap/buffer_bounds.hpp"


// ------------------------------
// Bounds resolution

namespace ipcmap {

  arrow::Result<int64_t> FooterLength(int64_t value, const char* what) {
    if (value < 0) {
      return OutOfSpec(
         OutOfSpecKind::kNegativeFooterLength
        ,std::string("negative ") + what + " in footer: " + std::to_string(value)
      );
    }

    return value;
  }

  arrow::Result<BufferBounds> GetBufferBounds(IpcBufferQueue& buffers) {
    if (buffers.empty()) {
      return OutOfSpec(OutOfSpecKind::kExpectedBuffer, "IPC body has fewer buffers than its schema");
    }

    IpcBuffer buffer = buffers.front();
    buffers.pop_front();

    ARROW_ASSIGN_OR_RAISE(auto offset, FooterLength(buffer.offset, "buffer offset"));
    ARROW_ASSIGN_OR_RAISE(auto length, FooterLength(buffer.length, "buffer length"));

    return BufferBounds { offset, length };
  }

  arrow::Result<const uint8_t*>
  GetBytes( const arrow::Buffer& data
           ,int64_t              block_offset
           ,const BufferBounds&  bounds) {
    // each step is checked against what is left so the sums cannot overflow
    const int64_t size = data.size();
    if (   block_offset  < 0
        or block_offset  > size
        or bounds.offset > size - block_offset
        or bounds.length > size - block_offset - bounds.offset) {
      return OutOfSpec(
         OutOfSpecKind::kOutOfBounds
        ,"buffer out of bounds: [" + std::to_string(bounds.offset) + ", +"
           + std::to_string(bounds.length) + ") at block offset "
           + std::to_string(block_offset) + " in " + std::to_string(size) + " bytes"
      );
    }

    return data.data() + block_offset + bounds.offset;
  }

  arrow::Result<const uint8_t*>
  GetValidity( const arrow::Buffer& data
              ,int64_t              block_offset
              ,IpcBufferQueue&      buffers
              ,int64_t              null_count) {
    ARROW_ASSIGN_OR_RAISE(auto bounds, GetBufferBounds(buffers));

    if (null_count > 0) { return GetBytes(data, block_offset, bounds); }

    return static_cast<const uint8_t*>(nullptr);
  }

} // namespace: ipcmap
