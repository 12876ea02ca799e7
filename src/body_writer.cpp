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

#include "ipcmap/body_writer.hpp"
#include "ipcmap/mmap_array.hpp"

#include "arrow/array.h"
#include "arrow/array/concatenate.h"
#include "arrow/array/util.h"
#include "arrow/type.h"

#include <string>


namespace ipcmap {

  // Anonymous namespace for internal functions
  namespace {

    int64_t PaddedLength(int64_t length) {
      const int64_t align = BodyWriter::kBufferAlignment;
      return ((length + align - 1) / align) * align;
    }

    int64_t ByteWidth(const arrow::DataType& type) {
      return static_cast<const arrow::FixedWidthType&>(type).bit_width() / 8;
    }

    bool HasSlicedData(const arrow::ArrayData& data) {
      if (data.offset != 0) { return true; }

      for (const auto& child : data.child_data) {
        if (HasSlicedData(*child)) { return true; }
      }

      return false;
    }

    //! The last offset of a binary-like array, i.e. the number of value bytes it uses
    template <typename OffsetType>
    int64_t ValuesLength(const arrow::ArrayData& data) {
      if (data.length == 0 or data.buffers[1] == nullptr) { return 0; }

      return static_cast<int64_t>(data.GetValues<OffsetType>(1)[data.length]);
    }

    arrow::Status CheckIpcChildren(const arrow::DataType& type, const IpcField& ipc_field) {
      if (ipc_field.fields.size() != static_cast<size_t>(type.num_fields())) {
        return OutOfSpec(
           OutOfSpecKind::kFieldMetadataMismatch
          ,"IPC field for " + type.ToString() + " does not match its child fields"
        );
      }

      return arrow::Status::OK();
    }

  } // anonymous namespace: ipcmap::<anonymous>


  // >> BodyWriter implementations

  BodyWriter::BodyWriter(arrow::MemoryPool* pool) : pool_(pool), body_(pool) {}

  arrow::Result<std::unique_ptr<BodyWriter>>
  BodyWriter::Make(int64_t leading_bytes, arrow::MemoryPool* pool) {
    if (leading_bytes < 0) {
      return arrow::Status::Invalid("Leading bytes must be non-negative");
    }

    std::unique_ptr<BodyWriter> writer { new BodyWriter(pool) };
    ARROW_RETURN_NOT_OK(writer->body_.Append(leading_bytes, static_cast<uint8_t>(0)));
    writer->block_start_ = leading_bytes;

    return std::move(writer);
  }

  arrow::Status
  BodyWriter::AppendColumn( const std::shared_ptr<arrow::Array>& array
                           ,const IpcField&                      ipc_field
                           ,Dictionaries&                        dictionaries) {
    std::shared_ptr<arrow::Array> column = array;

    // an IPC body has no room for offsets, so sliced data is compacted first
    if (HasSlicedData(*column->data())) {
      ARROW_ASSIGN_OR_RAISE(column, arrow::Concatenate({ array }, pool_));
    }

    return AppendNode(*column->data(), *column->type(), ipc_field, dictionaries);
  }

  arrow::Result<BatchLayout>
  BodyWriter::AppendRecordBatch( const arrow::RecordBatch&    batch
                                ,const std::vector<IpcField>& ipc_fields
                                ,Dictionaries&                dictionaries) {
    if (ipc_fields.size() != static_cast<size_t>(batch.num_columns())) {
      return OutOfSpec(
         OutOfSpecKind::kFieldMetadataMismatch
        ,"record batch has " + std::to_string(batch.num_columns()) + " columns but "
           + std::to_string(ipc_fields.size()) + " IPC fields were given"
      );
    }

    for (int col_ndx = 0; col_ndx < batch.num_columns(); ++col_ndx) {
      ARROW_RETURN_NOT_OK(AppendColumn(batch.column(col_ndx), ipc_fields[col_ndx], dictionaries));
    }

    return CloseBatch(batch.num_rows());
  }

  BatchLayout BodyWriter::CloseBatch(int64_t length) {
    BatchLayout layout;
    layout.length       = length;
    layout.block_offset = block_start_;
    layout.nodes        = std::move(nodes_);
    layout.buffers      = std::move(buffers_);

    nodes_.clear();
    buffers_.clear();
    block_start_ = body_.length();

    return layout;
  }

  arrow::Result<std::shared_ptr<arrow::Buffer>> BodyWriter::Finish() {
    return body_.Finish();
  }

  arrow::Status
  BodyWriter::AppendBuffer(const std::shared_ptr<arrow::Buffer>& buffer, int64_t size) {
    if (size > 0 and (buffer == nullptr or buffer->size() < size)) {
      return arrow::Status::Invalid(
        "Buffer holds fewer than the " + std::to_string(size) + " bytes its array needs"
      );
    }

    buffers_.push_back(IpcBuffer { body_.length() - block_start_, size });

    if (size > 0) { ARROW_RETURN_NOT_OK(body_.Append(buffer->data(), size)); }

    const int64_t padding = PaddedLength(size) - size;
    return body_.Append(padding, static_cast<uint8_t>(0));
  }

  arrow::Status
  BodyWriter::AppendValidity(const arrow::ArrayData& data, int64_t null_count) {
    // the slot is always written; it only has bytes when there are nulls
    if (null_count == 0) { return AppendBuffer(nullptr, 0); }

    return AppendBuffer(data.buffers[0], (data.length + 7) / 8);
  }

  arrow::Status
  BodyWriter::AppendOffsets(const arrow::ArrayData& data, int64_t offset_width) {
    const auto& offsets = data.buffers[1];

    // empty arrays may come without an offsets buffer; the body still needs one offset
    if (data.length == 0 and (offsets == nullptr or offsets->size() < offset_width)) {
      buffers_.push_back(IpcBuffer { body_.length() - block_start_, offset_width });
      return body_.Append(PaddedLength(offset_width), static_cast<uint8_t>(0));
    }

    return AppendBuffer(offsets, (data.length + 1) * offset_width);
  }

  arrow::Status
  BodyWriter::AppendNode( const arrow::ArrayData& data
                         ,const arrow::DataType&  type
                         ,const IpcField&         ipc_field
                         ,Dictionaries&           dictionaries) {
    const int64_t null_count = data.GetNullCount();
    nodes_.push_back(FieldNode { data.length, null_count });

    const arrow::DataType& storage = StorageType(type);
    switch (GetPhysicalType(storage)) {
      case PhysicalType::kNull:
        return arrow::Status::OK();

      case PhysicalType::kBoolean:
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        return AppendBuffer(data.buffers[1], (data.length + 7) / 8);

      case PhysicalType::kPrimitive:
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        return AppendBuffer(data.buffers[1], data.length * ByteWidth(storage));

      case PhysicalType::kFixedSizeBinary:
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        return AppendBuffer(data.buffers[1], data.length * ByteWidth(storage));

      case PhysicalType::kBinary:
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        ARROW_RETURN_NOT_OK(AppendOffsets(data, 4));
        return AppendBuffer(data.buffers[2], ValuesLength<int32_t>(data));

      case PhysicalType::kLargeBinary:
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        ARROW_RETURN_NOT_OK(AppendOffsets(data, 8));
        return AppendBuffer(data.buffers[2], ValuesLength<int64_t>(data));

      case PhysicalType::kList:
      case PhysicalType::kMap:
        ARROW_RETURN_NOT_OK(CheckIpcChildren(storage, ipc_field));
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        ARROW_RETURN_NOT_OK(AppendOffsets(data, 4));
        return AppendNode(*data.child_data[0], *storage.field(0)->type(), ipc_field.fields[0], dictionaries);

      case PhysicalType::kLargeList:
        ARROW_RETURN_NOT_OK(CheckIpcChildren(storage, ipc_field));
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        ARROW_RETURN_NOT_OK(AppendOffsets(data, 8));
        return AppendNode(*data.child_data[0], *storage.field(0)->type(), ipc_field.fields[0], dictionaries);

      case PhysicalType::kFixedSizeList:
        ARROW_RETURN_NOT_OK(CheckIpcChildren(storage, ipc_field));
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        return AppendNode(*data.child_data[0], *storage.field(0)->type(), ipc_field.fields[0], dictionaries);

      case PhysicalType::kStruct:
        ARROW_RETURN_NOT_OK(CheckIpcChildren(storage, ipc_field));
        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        for (int field_ndx = 0; field_ndx < storage.num_fields(); ++field_ndx) {
          ARROW_RETURN_NOT_OK(AppendNode(
             *data.child_data[field_ndx]
            ,*storage.field(field_ndx)->type()
            ,ipc_field.fields[field_ndx]
            ,dictionaries
          ));
        }
        return arrow::Status::OK();

      case PhysicalType::kDictionary: {
        if (not ipc_field.dictionary_id.has_value()) {
          return OutOfSpec(OutOfSpecKind::kMissingDictionary, "dictionary field has no dictionary id");
        }

        const auto& dict_type = static_cast<const arrow::DictionaryType&>(storage);
        dictionaries[*ipc_field.dictionary_id] = arrow::MakeArray(data.dictionary);

        ARROW_RETURN_NOT_OK(AppendValidity(data, null_count));
        return AppendBuffer(data.buffers[1], data.length * ByteWidth(*dict_type.index_type()));
      }

      case PhysicalType::kUnsupported:
        break;
    }

    return OutOfSpec(
       OutOfSpecKind::kUnsupportedType
      ,"cannot lay out an IPC body for type " + type.ToString()
    );
  }


  // >> Single-batch helpers

  arrow::Result<EncodedBatch>
  EncodeArray( const std::shared_ptr<arrow::Array>& array
              ,const IpcField&                      ipc_field
              ,Dictionaries&                        dictionaries
              ,int64_t                              block_offset) {
    ARROW_ASSIGN_OR_RAISE(auto writer, BodyWriter::Make(block_offset));
    ARROW_RETURN_NOT_OK(writer->AppendColumn(array, ipc_field, dictionaries));

    EncodedBatch encoded;
    encoded.layout = writer->CloseBatch(array->length());
    ARROW_ASSIGN_OR_RAISE(encoded.body, writer->Finish());

    return encoded;
  }

  arrow::Result<EncodedBatch>
  EncodeRecordBatch( const arrow::RecordBatch&    batch
                    ,const std::vector<IpcField>& ipc_fields
                    ,Dictionaries&                dictionaries
                    ,int64_t                      block_offset) {
    ARROW_ASSIGN_OR_RAISE(auto writer, BodyWriter::Make(block_offset));

    EncodedBatch encoded;
    ARROW_ASSIGN_OR_RAISE(encoded.layout, writer->AppendRecordBatch(batch, ipc_fields, dictionaries));
    ARROW_ASSIGN_OR_RAISE(encoded.body  , writer->Finish());

    return encoded;
  }

} // namespace: ipcmap
