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
#include "arrow/type_fwd.h"
#include "arrow/type.h"
#include "arrow/status.h"
#include "arrow/result.h"
#include "arrow/buffer.h"
#include "arrow/record_batch.h"

#include "ipcmap/ffi_array.hpp"
#include "ipcmap/ipc_types.hpp"
#include "ipcmap/status.hpp"


namespace ipcmap {

  //! How much of the mapped data is checked after it crosses into arrow::Array
  enum class ValidationLevel : int8_t {
     kNone        //! trust the producer for offsets and child ranges
    ,kStructural  //! arrow::Array::Validate
    ,kFull        //! arrow::Array::ValidateFull
  };

  struct MmapOptions {
    ValidationLevel validation         { ValidationLevel::kNone };

    //! MmapRecordBatch fails if nodes or buffers are left over after the last column
    bool            require_exhaustive { true };

    static MmapOptions Defaults() { return MmapOptions(); }
  };


  //! In-memory layout families; every logical type maps onto one of these
  enum class PhysicalType : int8_t {
     kNull
    ,kBoolean
    ,kPrimitive
    ,kBinary
    ,kLargeBinary
    ,kFixedSizeBinary
    ,kList
    ,kLargeList
    ,kFixedSizeList
    ,kStruct
    ,kMap
    ,kDictionary
    ,kUnsupported
  };

  //! Extension types report the layout of their storage type
  PhysicalType GetPhysicalType(const arrow::DataType& type);

  //! The innermost storage type of an extension type; any other type is returned as is
  const arrow::DataType& StorageType(const arrow::DataType& type);


  // >> Mapping functions

  /**
   * Pops one field node and builds the ArrowArray for `type`, recursing into
   * children. Buffers point into `data`; every handle in the result keeps a
   * reference to it. On error nothing built so far is left allocated.
   */
  arrow::Result<ArrowArrayHolder>
  MmapFfiArray( const std::shared_ptr<arrow::Buffer>& data
               ,int64_t                               block_offset
               ,const arrow::DataType&                type
               ,const IpcField&                       ipc_field
               ,const Dictionaries&                   dictionaries
               ,FieldNodeQueue&                       field_nodes
               ,IpcBufferQueue&                       buffers);

  //! Maps one column and imports it as an arrow::Array without copying
  arrow::Result<std::shared_ptr<arrow::Array>>
  MmapArray( std::shared_ptr<arrow::Buffer>          data
            ,int64_t                                 block_offset
            ,const std::shared_ptr<arrow::DataType>& type
            ,const IpcField&                         ipc_field
            ,const Dictionaries&                     dictionaries
            ,FieldNodeQueue&                         field_nodes
            ,IpcBufferQueue&                         buffers
            ,const MmapOptions&                      options = MmapOptions::Defaults());

  //! Maps every column of `schema`, in order, from one batch body
  arrow::Result<std::shared_ptr<arrow::RecordBatch>>
  MmapRecordBatch( std::shared_ptr<arrow::Buffer>        data
                  ,int64_t                               block_offset
                  ,int64_t                               length
                  ,const std::shared_ptr<arrow::Schema>& schema
                  ,const std::vector<IpcField>&          ipc_fields
                  ,const Dictionaries&                   dictionaries
                  ,FieldNodeQueue&                       field_nodes
                  ,IpcBufferQueue&                       buffers
                  ,const MmapOptions&                    options = MmapOptions::Defaults());

  //! Same as above, for a batch described by a BatchLayout
  arrow::Result<std::shared_ptr<arrow::RecordBatch>>
  MmapRecordBatch( std::shared_ptr<arrow::Buffer>        data
                  ,const BatchLayout&                    layout
                  ,const std::shared_ptr<arrow::Schema>& schema
                  ,const std::vector<IpcField>&          ipc_fields
                  ,const Dictionaries&                   dictionaries
                  ,const MmapOptions&                    options = MmapOptions::Defaults());

} // namespace ipcmap
