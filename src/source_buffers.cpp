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

#include "ipcmap/source_buffers.hpp"

#include "arrow/io/file.h"
#include "arrow/status.h"
#include "arrow/util/logging.h"


// ------------------------------
// Reader implementations

namespace ipcmap {

  // Anonymous namespace for internal functions
  namespace {

    /** Reads all of `file`; for a memory-mapped file this is a view of the mapping. */
    arrow::Result<std::shared_ptr<arrow::Buffer>>
    ReadWhole(arrow::io::RandomAccessFile& file) {
      ARROW_ASSIGN_OR_RAISE(auto  arrow_fsize, file.GetSize());
      ARROW_ASSIGN_OR_RAISE(auto arrow_buffer, file.ReadAt(0, arrow_fsize));

      if (not arrow_buffer->is_cpu()) {
        return arrow::Status::Invalid(
          "Read IPC file into memory but it is not CPU-accessible"
        );
      }

      return arrow_buffer;
    }

  } // anonymous namespace: ipcmap::<anonymous>


  //! Given a file path, return a buffer over a read-only mapping of the file.
  arrow::Result<std::shared_ptr<arrow::Buffer>>
  MapIPCFile(const std::string& path_to_file) {
    ARROW_LOG(DEBUG) << "Memory-mapping arrow IPC-formatted file: " << path_to_file;

    ARROW_ASSIGN_OR_RAISE(
       auto mapped_file
      ,arrow::io::MemoryMappedFile::Open(path_to_file, arrow::io::FileMode::READ)
    );

    // the buffer keeps the mapping alive after `mapped_file` goes away
    return ReadWhole(*mapped_file);
  }

  //! Given a file path, return the file's contents as a buffer.
  arrow::Result<std::shared_ptr<arrow::Buffer>>
  BufferFromIPCFile(const std::string& path_to_file) {
    ARROW_LOG(DEBUG) << "Reading arrow IPC-formatted file: " << path_to_file;

    ARROW_ASSIGN_OR_RAISE(auto arrow_fhandle, arrow::io::ReadableFile::Open(path_to_file));

    return ReadWhole(*arrow_fhandle);
  }

} // namespace: ipcmap
