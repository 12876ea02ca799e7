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
#include <optional>
#include <string>

// >> Arrow dependencies
#include "arrow/status.h"


namespace ipcmap {

  //! The ways an IPC body can disagree with its footer metadata
  enum class OutOfSpecKind : int8_t {
     kExpectedBuffer
    ,kExpectedNode
    ,kNegativeFooterLength
    ,kOutOfBounds
    ,kMisaligned
    ,kTooSmall
    ,kMissingDictionary
    ,kUnsupportedType
    ,kFieldMetadataMismatch
    ,kUnconsumedBuffers
  };

  const char* OutOfSpecKindName(OutOfSpecKind kind);


  //! Attached to every arrow::Status produced while mapping an IPC body
  class OutOfSpecDetail : public arrow::StatusDetail {
    public:
      explicit OutOfSpecDetail(OutOfSpecKind kind) : kind_(kind) {}

      const char* type_id() const override;
      std::string ToString() const override;

      OutOfSpecKind kind() const { return kind_; }

      //! Returns the detail carried by `status`, or null if it has none
      static std::shared_ptr<OutOfSpecDetail> UnwrapStatus(const arrow::Status& status);

    private:
      OutOfSpecKind kind_;
  };


  //! Builds an error status of the given kind. kUnsupportedType maps to
  //  StatusCode::NotImplemented, every other kind to StatusCode::Invalid.
  arrow::Status OutOfSpec(OutOfSpecKind kind, std::string message);

  //! The kind carried by `status`, if it came from this library
  std::optional<OutOfSpecKind> GetOutOfSpecKind(const arrow::Status& status);

} // namespace ipcmap
