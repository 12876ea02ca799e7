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
#include <vector>

// >> Arrow dependencies
#include "arrow/type_fwd.h"

#include "ipcmap/ipc_types.hpp"


namespace ipcmap {

  //! Builds the IpcField tree matching `type`. Every dictionary type met in a
  //  pre-order walk takes the next id from `next_dictionary_id`.
  IpcField DefaultIpcField(const arrow::DataType& type, int64_t& next_dictionary_id);

  //! IpcFields for every field of `schema`, with dictionary ids counted from 0
  std::vector<IpcField> DefaultIpcFields(const arrow::Schema& schema);

} // namespace ipcmap
