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

#include "ipcmap/ipc_fields.hpp"

#include "arrow/extension_type.h"
#include "arrow/type.h"


namespace ipcmap {

  IpcField DefaultIpcField(const arrow::DataType& type, int64_t& next_dictionary_id) {
    IpcField ipc_field;

    switch (type.id()) {
      case arrow::Type::EXTENSION: {
        const auto& ext_type = static_cast<const arrow::ExtensionType&>(type);
        return DefaultIpcField(*ext_type.storage_type(), next_dictionary_id);
      }

      // the dictionary id is taken before the value type's own dictionaries
      case arrow::Type::DICTIONARY: {
        const auto& dict_type = static_cast<const arrow::DictionaryType&>(type);
        ipc_field.dictionary_id = next_dictionary_id++;

        const auto& value_type = *dict_type.value_type();
        for (const auto& child : value_type.fields()) {
          ipc_field.fields.push_back(DefaultIpcField(*child->type(), next_dictionary_id));
        }
        return ipc_field;
      }

      default:
        break;
    }

    for (const auto& child : type.fields()) {
      ipc_field.fields.push_back(DefaultIpcField(*child->type(), next_dictionary_id));
    }

    return ipc_field;
  }

  std::vector<IpcField> DefaultIpcFields(const arrow::Schema& schema) {
    int64_t next_dictionary_id = 0;

    std::vector<IpcField> ipc_fields;
    ipc_fields.reserve(schema.num_fields());
    for (const auto& field : schema.fields()) {
      ipc_fields.push_back(DefaultIpcField(*field->type(), next_dictionary_id));
    }

    return ipc_fields;
  }

} // namespace: ipcmap
