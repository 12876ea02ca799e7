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

#include "ipcmap/mapped_batch_reader.hpp"

#include "arrow/c/bridge.h"
#include "arrow/util/logging.h"

#include <utility>


namespace ipcmap {

  // >> MappedBatchReader implementations

  MappedBatchReader::MappedBatchReader( std::shared_ptr<arrow::Buffer>      data
                                       ,std::shared_ptr<arrow::Schema>      schema
                                       ,std::vector<IpcField>               ipc_fields
                                       ,std::shared_ptr<const Dictionaries> dictionaries
                                       ,std::vector<BatchLayout>            batches
                                       ,MmapOptions                         options)
    :  data_         (std::move(data)        )
      ,schema_       (std::move(schema)      )
      ,ipc_fields_   (std::move(ipc_fields)  )
      ,dictionaries_ (dictionaries ? std::move(dictionaries) : std::make_shared<const Dictionaries>())
      ,batches_      (std::move(batches)     )
      ,options_      (options                )
      ,next_batch_id_(0                      ) {}

  std::shared_ptr<arrow::Schema>
  MappedBatchReader::schema() const { return schema_; }

  //! Maps the next record batch in the body. Sets *batch to null at end of body
  arrow::Status
  MappedBatchReader::ReadNext(std::shared_ptr<arrow::RecordBatch>* batch) {
    if (next_batch_id_ >= batches_.size()) {
      *batch = nullptr;
      return arrow::Status::OK();
    }

    ARROW_LOG(DEBUG) << "Mapping record batch " << next_batch_id_
                     << " of " << batches_.size();

    // queues are built fresh for every batch and drained by the mapping
    const auto& layout = batches_[next_batch_id_++];
    ARROW_ASSIGN_OR_RAISE(
       *batch
      ,MmapRecordBatch(data_, layout, schema_, ipc_fields_, *dictionaries_, options_)
    );

    return arrow::Status::OK();
  }


  //! Creates a C stream over the mapped batches
  arrow::Status
  ExportMappedBatches( std::shared_ptr<MappedBatchReader> reader
                      ,ArrowArrayStream*                  out) {
    return arrow::ExportRecordBatchReader(std::move(reader), out);
  }

} // namespace ipcmap
