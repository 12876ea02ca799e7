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

#include "ipcmap/status.hpp"


namespace ipcmap {

  namespace {

    constexpr char kOutOfSpecDetailTypeId[] = "ipcmap::OutOfSpecDetail";

  } // anonymous namespace: ipcmap::<anonymous>


  const char* OutOfSpecKindName(OutOfSpecKind kind) {
    switch (kind) {
      case OutOfSpecKind::kExpectedBuffer:        return "ExpectedBuffer";
      case OutOfSpecKind::kExpectedNode:          return "ExpectedNode";
      case OutOfSpecKind::kNegativeFooterLength:  return "NegativeFooterLength";
      case OutOfSpecKind::kOutOfBounds:           return "OutOfBounds";
      case OutOfSpecKind::kMisaligned:            return "Misaligned";
      case OutOfSpecKind::kTooSmall:              return "TooSmall";
      case OutOfSpecKind::kMissingDictionary:     return "MissingDictionary";
      case OutOfSpecKind::kUnsupportedType:       return "UnsupportedType";
      case OutOfSpecKind::kFieldMetadataMismatch: return "FieldMetadataMismatch";
      case OutOfSpecKind::kUnconsumedBuffers:     return "UnconsumedBuffers";
    }

    return "Unknown";
  }


  // >> OutOfSpecDetail implementations

  const char* OutOfSpecDetail::type_id() const { return kOutOfSpecDetailTypeId; }

  std::string OutOfSpecDetail::ToString() const {
    return std::string("IPC body out of spec: ") + OutOfSpecKindName(kind_);
  }

  std::shared_ptr<OutOfSpecDetail>
  OutOfSpecDetail::UnwrapStatus(const arrow::Status& status) {
    const auto& detail = status.detail();
    if (not detail or detail->type_id() != kOutOfSpecDetailTypeId) { return nullptr; }

    return std::static_pointer_cast<OutOfSpecDetail>(detail);
  }


  // >> Status constructors

  arrow::Status OutOfSpec(OutOfSpecKind kind, std::string message) {
    auto code = kind == OutOfSpecKind::kUnsupportedType
                  ? arrow::StatusCode::NotImplemented
                  : arrow::StatusCode::Invalid;

    return arrow::Status(code, std::move(message), std::make_shared<OutOfSpecDetail>(kind));
  }

  std::optional<OutOfSpecKind> GetOutOfSpecKind(const arrow::Status& status) {
    auto detail = OutOfSpecDetail::UnwrapStatus(status);
    if (detail == nullptr) { return std::nullopt; }

    return detail->kind();
  }

} // namespace: ipcmap
