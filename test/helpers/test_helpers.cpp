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

#include "test_helpers.hpp"

#include <cstring>

#include "ipcmap/body_writer.hpp"
#include "ipcmap/ipc_fields.hpp"


namespace ipcmap { namespace test {

  // >> TestBody

  TestBody::TestBody(int64_t block_offset) : block_offset(block_offset), body_(block_offset, 0) {}

  TestBody& TestBody::Node(int64_t length, int64_t null_count) {
    nodes.push_back(FieldNode { length, null_count });
    return *this;
  }

  TestBody& TestBody::Bytes(const std::vector<uint8_t>& bytes) {
    const auto offset = static_cast<int64_t>(body_.size()) - block_offset;
    buffers.push_back(IpcBuffer { offset, static_cast<int64_t>(bytes.size()) });

    body_.insert(body_.end(), bytes.begin(), bytes.end());
    while (body_.size() % 8 != 0) { body_.push_back(0); }

    return *this;
  }

  TestBody& TestBody::Bytes(const std::string& bytes) {
    return Bytes(std::vector<uint8_t>(bytes.begin(), bytes.end()));
  }

  TestBody& TestBody::Empty() {
    return Descriptor(static_cast<int64_t>(body_.size()) - block_offset, 0);
  }

  TestBody& TestBody::Descriptor(int64_t offset, int64_t length) {
    buffers.push_back(IpcBuffer { offset, length });
    return *this;
  }

  std::shared_ptr<arrow::Buffer> TestBody::Finish() const {
    REQUIRE_RESULT(
       std::shared_ptr<arrow::Buffer> buffer
      ,arrow::AllocateBuffer(static_cast<int64_t>(body_.size()))
    );

    if (not body_.empty()) {
      std::memcpy(buffer->mutable_data(), body_.data(), body_.size());
    }

    return buffer;
  }


  // >> Assertions

  void RequireOutOfSpec(const arrow::Status& status, OutOfSpecKind kind) {
    INFO(status.ToString());
    REQUIRE_FALSE(status.ok());

    auto status_kind = GetOutOfSpecKind(status);
    REQUIRE(status_kind.has_value());
    CHECK(std::string(OutOfSpecKindName(*status_kind)) == OutOfSpecKindName(kind));

    if (kind == OutOfSpecKind::kUnsupportedType) { CHECK(status.IsNotImplemented()); }
    else                                         { CHECK(status.IsInvalid());        }
  }

  std::shared_ptr<arrow::Array>
  RoundTrip(const std::shared_ptr<arrow::Array>& array, int64_t block_offset) {
    int64_t      next_dictionary_id = 0;
    IpcField     ipc_field          = DefaultIpcField(*array->type(), next_dictionary_id);
    Dictionaries dictionaries;

    REQUIRE_RESULT(auto encoded, EncodeArray(array, ipc_field, dictionaries, block_offset));
    REQUIRE(encoded.layout.block_offset == block_offset);

    auto field_nodes = encoded.layout.NodeQueue();
    auto buffers     = encoded.layout.BufferQueue();

    MmapOptions options;
    options.validation = ValidationLevel::kFull;

    REQUIRE_RESULT(
       auto mapped
      ,MmapArray(
          encoded.body
         ,encoded.layout.block_offset
         ,array->type()
         ,ipc_field
         ,dictionaries
         ,field_nodes
         ,buffers
         ,options
       )
    );

    CHECK(field_nodes.empty());
    CHECK(buffers.empty());

    return mapped;
  }


  // >> Array construction

  namespace {

    template <typename BuilderType>
    std::shared_ptr<arrow::Array>
    BinaryArray(const std::vector<std::string>& values, const std::vector<bool>& is_valid) {
      BuilderType builder;
      for (size_t ndx = 0; ndx < values.size(); ++ndx) {
        if (not is_valid.empty() and not is_valid[ndx]) { REQUIRE_OK(builder.AppendNull()); }
        else                                            { REQUIRE_OK(builder.Append(values[ndx])); }
      }

      REQUIRE_RESULT(auto array, builder.Finish());
      return array;
    }

  } // anonymous namespace

  std::shared_ptr<arrow::Array>
  StringArray(const std::vector<std::string>& values, const std::vector<bool>& is_valid) {
    return BinaryArray<arrow::StringBuilder>(values, is_valid);
  }

  std::shared_ptr<arrow::Array>
  LargeStringArray(const std::vector<std::string>& values, const std::vector<bool>& is_valid) {
    return BinaryArray<arrow::LargeStringBuilder>(values, is_valid);
  }

  std::shared_ptr<arrow::Array>
  Int32ListArray( const std::vector<std::vector<int32_t>>& values
                 ,const std::vector<bool>&                 is_valid) {
    auto value_builder = std::make_shared<arrow::Int32Builder>();
    arrow::ListBuilder builder(arrow::default_memory_pool(), value_builder);

    for (size_t ndx = 0; ndx < values.size(); ++ndx) {
      if (not is_valid.empty() and not is_valid[ndx]) {
        REQUIRE_OK(builder.AppendNull());
        continue;
      }

      REQUIRE_OK(builder.Append());
      REQUIRE_OK(value_builder->AppendValues(values[ndx]));
    }

    REQUIRE_RESULT(auto array, builder.Finish());
    return array;
  }

}} // namespace ipcmap::test
