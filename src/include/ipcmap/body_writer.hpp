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
#include <vector>

// >> Arrow dependencies
#include "arrow/array/data.h"
#include "arrow/buffer.h"
#include "arrow/buffer_builder.h"
#include "arrow/memory_pool.h"
#include "arrow/record_batch.h"
#include "arrow/result.h"
#include "arrow/status.h"
#include "arrow/type_fwd.h"

#include "ipcmap/ipc_types.hpp"
#include "ipcmap/status.hpp"


namespace ipcmap {

  //! One batch body together with the footer metadata describing it
  struct EncodedBatch {
    std::shared_ptr<arrow::Buffer> body;
    BatchLayout                    layout;
  };

  /**
   * Lays out arrays the way an IPC record batch body stores them: one field node
   * per node of the type tree in pre-order, the buffers of each node in the order
   * MmapFfiArray consumes them, each buffer padded to a multiple of 8 bytes.
   * Several batches can share one body; each starts where the previous ended.
   */
  class BodyWriter {
    public:
      //! note: buffers are padded to this many bytes
      static constexpr int64_t kBufferAlignment = 8;

      //! `leading_bytes` zero bytes come before the first batch (e.g. a message header)
      static arrow::Result<std::unique_ptr<BodyWriter>>
      Make(int64_t leading_bytes = 0, arrow::MemoryPool* pool = arrow::default_memory_pool());

      //! Appends one column to the open batch. Dictionary values are stored in
      //  `dictionaries` under the ids of `ipc_field`.
      arrow::Status
      AppendColumn( const std::shared_ptr<arrow::Array>& array
                   ,const IpcField&                      ipc_field
                   ,Dictionaries&                        dictionaries);

      //! Appends every column of `batch` and closes it
      arrow::Result<BatchLayout>
      AppendRecordBatch( const arrow::RecordBatch&    batch
                        ,const std::vector<IpcField>& ipc_fields
                        ,Dictionaries&                dictionaries);

      //! Closes the open batch; the next column starts a new one
      BatchLayout CloseBatch(int64_t length);

      arrow::Result<std::shared_ptr<arrow::Buffer>> Finish();

    private:
      explicit BodyWriter(arrow::MemoryPool* pool);

      arrow::Status AppendNode( const arrow::ArrayData& data
                               ,const arrow::DataType&  type
                               ,const IpcField&         ipc_field
                               ,Dictionaries&           dictionaries);

      arrow::Status AppendValidity(const arrow::ArrayData& data, int64_t null_count);
      arrow::Status AppendOffsets(const arrow::ArrayData& data, int64_t offset_width);
      arrow::Status AppendBuffer(const std::shared_ptr<arrow::Buffer>& buffer, int64_t size);

      arrow::MemoryPool*     pool_;
      arrow::BufferBuilder   body_;
      int64_t                block_start_ { 0 };
      std::vector<FieldNode> nodes_;
      std::vector<IpcBuffer> buffers_;
  };


  //! Encodes one array as a single-column batch body
  arrow::Result<EncodedBatch>
  EncodeArray( const std::shared_ptr<arrow::Array>& array
              ,const IpcField&                      ipc_field
              ,Dictionaries&                        dictionaries
              ,int64_t                              block_offset = 0);

  //! Encodes a record batch; its body starts after `block_offset` zero bytes
  arrow::Result<EncodedBatch>
  EncodeRecordBatch( const arrow::RecordBatch&    batch
                    ,const std::vector<IpcField>& ipc_fields
                    ,Dictionaries&                dictionaries
                    ,int64_t                      block_offset = 0);

} // namespace ipcmap
