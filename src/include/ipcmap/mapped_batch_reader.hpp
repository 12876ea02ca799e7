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

#include <cstddef>
#include <memory>
#include <vector>

// >> Arrow dependencies
#include "arrow/type_fwd.h"
#include "arrow/type.h"
#include "arrow/status.h"
#include "arrow/result.h"
#include "arrow/buffer.h"
#include "arrow/record_batch.h"
#include "arrow/c/abi.h"

#include "ipcmap/ipc_types.hpp"
#include "ipcmap/mmap_array.hpp"


namespace ipcmap {

  //! Yields the batches of one mapped body, in order, without copying their data
  struct MappedBatchReader : public arrow::RecordBatchReader {
      MappedBatchReader( std::shared_ptr<arrow::Buffer>      data
                        ,std::shared_ptr<arrow::Schema>      schema
                        ,std::vector<IpcField>               ipc_fields
                        ,std::shared_ptr<const Dictionaries> dictionaries
                        ,std::vector<BatchLayout>            batches
                        ,MmapOptions                         options = MmapOptions::Defaults());

      ~MappedBatchReader() = default;

      std::shared_ptr<arrow::Schema> schema() const override;

      //! Maps the next record batch in the body. Sets *batch to null at the end.
      arrow::Status ReadNext(std::shared_ptr<arrow::RecordBatch>* batch) override;

      size_t num_batches() const { return batches_.size(); }

    protected:
      std::shared_ptr<arrow::Buffer>      data_;
      std::shared_ptr<arrow::Schema>      schema_;
      std::vector<IpcField>               ipc_fields_;
      std::shared_ptr<const Dictionaries> dictionaries_;
      std::vector<BatchLayout>            batches_;
      MmapOptions                         options_;
      size_t                              next_batch_id_;
  };


  //! Exports `reader` to the C stream interface; `out` owns it afterwards
  arrow::Status
  ExportMappedBatches( std::shared_ptr<MappedBatchReader> reader
                      ,ArrowArrayStream*                  out);

} // namespace ipcmap
