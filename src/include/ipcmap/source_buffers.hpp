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

#pragma once

#include <memory>
#include <string>

// >> Arrow dependencies
#include "arrow/buffer.h"
#include "arrow/result.h"


// ------------------------------
// Public prototypes

// >> Functions that produce the bytes a batch is mapped from
namespace ipcmap {

  //! Memory-maps a file read-only. The returned buffer references the mapping
  //  directly and keeps it open for as long as the buffer is alive.
  arrow::Result<std::shared_ptr<arrow::Buffer>>
  MapIPCFile(const std::string& path_to_file);

  //! Reads a whole file into memory
  arrow::Result<std::shared_ptr<arrow::Buffer>>
  BufferFromIPCFile(const std::string& path_to_file);

} // namespace ipcmap
