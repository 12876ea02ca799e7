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
#include <deque>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

// >> Arrow dependencies
#include "arrow/type_fwd.h"


namespace ipcmap {

  //! Row count and null count of one flattened schema node, as written in the footer
  struct FieldNode {
    int64_t length;
    int64_t null_count;
  };

  //! Location of one physical buffer, relative to the start of the batch body
  struct IpcBuffer {
    int64_t offset;
    int64_t length;
  };

  //! Both queues are drained from the front, in pre-order of the type tree
  using FieldNodeQueue = std::deque<FieldNode>;
  using IpcBufferQueue = std::deque<IpcBuffer>;

  //! Per-field IPC metadata: nested child fields and, for dictionary types, an id
  struct IpcField {
    std::vector<IpcField>  fields;
    std::optional<int64_t> dictionary_id;
  };

  //! Materialized dictionaries, by dictionary id
  using Dictionaries = std::unordered_map<int64_t, std::shared_ptr<arrow::Array>>;

  //! The footer metadata of one record batch whose body is already in memory
  struct BatchLayout {
    int64_t                length       { 0 };
    int64_t                block_offset { 0 };
    std::vector<FieldNode> nodes;
    std::vector<IpcBuffer> buffers;

    FieldNodeQueue NodeQueue()   const { return FieldNodeQueue(nodes.begin(), nodes.end());     }
    IpcBufferQueue BufferQueue() const { return IpcBufferQueue(buffers.begin(), buffers.end()); }
  };

} // namespace ipcmap
