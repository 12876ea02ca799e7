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

#include "ipcmap/mmap_array.hpp"
#include "ipcmap/buffer_bounds.hpp"

#include "arrow/array.h"
#include "arrow/c/bridge.h"
#include "arrow/extension_type.h"
#include "arrow/util/decimal.h"
#include "arrow/util/logging.h"

#include <string>
#include <utility>


// ------------------------------
// Aliases

using SourceBytes = std::shared_ptr<arrow::Buffer>;


// ------------------------------
// Per-physical-type builders

namespace ipcmap {

  // Anonymous namespace for internal functions
  namespace {

    //! The arguments every recursive call shares
    struct MapContext {
      const SourceBytes&  data;
      int64_t             block_offset;
      const Dictionaries& dictionaries;
      FieldNodeQueue&     field_nodes;
      IpcBufferQueue&     buffers;
    };

    //! A field node whose counts are known to be non-negative
    struct NodeCounts {
      int64_t length;
      int64_t null_count;
    };

    arrow::Result<NodeCounts> ReadNode(const FieldNode& node) {
      ARROW_ASSIGN_OR_RAISE(auto length    , FooterLength(node.length    , "node length"    ));
      ARROW_ASSIGN_OR_RAISE(auto null_count, FooterLength(node.null_count, "node null count"));

      return NodeCounts { length, null_count };
    }

    ArrowArrayHolder
    CreateArray( const SourceBytes&            data
                ,const NodeCounts&             node
                ,std::vector<const void*>      buffers
                ,std::vector<ArrowArrayHolder> children   = {}
                ,ArrowArrayHolder              dictionary = ArrowArrayHolder()) {
      return CreateFfiArray<arrow::Buffer>(
         data
        ,node.length
        ,node.null_count
        ,std::move(buffers)
        ,std::move(children)
        ,std::move(dictionary)
      );
    }

    arrow::Result<const uint8_t*> MapValidity(MapContext& ctx, const NodeCounts& node) {
      return GetValidity(*ctx.data, ctx.block_offset, ctx.buffers, node.null_count);
    }

    arrow::Status CheckChildFields(const arrow::DataType& type, const IpcField& ipc_field) {
      const auto expected = static_cast<size_t>(type.num_fields());
      if (ipc_field.fields.size() != expected) {
        return OutOfSpec(
           OutOfSpecKind::kFieldMetadataMismatch
          ,"IPC field for " + type.ToString() + " has " + std::to_string(ipc_field.fields.size())
             + " child fields, expected " + std::to_string(expected)
        );
      }

      return arrow::Status::OK();
    }

    arrow::Result<ArrowArrayHolder>
    MapNode(MapContext& ctx, const arrow::DataType& type, const IpcField& ipc_field);


    // >> Leaf layouts

    arrow::Result<ArrowArrayHolder> MmapNull(MapContext& ctx, const NodeCounts& node) {
      return CreateArray(ctx.data, node, {});
    }

    arrow::Result<ArrowArrayHolder> MmapBoolean(MapContext& ctx, const NodeCounts& node) {
      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));

      const int64_t value_bytes = (node.length + 7) / 8;
      ARROW_ASSIGN_OR_RAISE(
         auto values
        ,GetBuffer<uint8_t>(*ctx.data, ctx.block_offset, ctx.buffers, value_bytes)
      );

      return CreateArray(ctx.data, node, { validity, values });
    }

    template <typename T>
    arrow::Result<ArrowArrayHolder> MmapPrimitive(MapContext& ctx, const NodeCounts& node) {
      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));
      ARROW_ASSIGN_OR_RAISE(
         auto values
        ,GetBuffer<T>(*ctx.data, ctx.block_offset, ctx.buffers, node.length)
      );

      return CreateArray(ctx.data, node, { validity, values });
    }

    //! Offsets must hold rows + 1 entries; their monotonicity and the extent of the
    //  values they address are left to the consumer.
    template <typename OffsetType>
    arrow::Result<ArrowArrayHolder> MmapBinary(MapContext& ctx, const NodeCounts& node) {
      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));
      ARROW_ASSIGN_OR_RAISE(
         auto offsets
        ,GetBuffer<OffsetType>(*ctx.data, ctx.block_offset, ctx.buffers, node.length + 1)
      );
      ARROW_ASSIGN_OR_RAISE(
         auto values
        ,GetBuffer<uint8_t>(*ctx.data, ctx.block_offset, ctx.buffers, 0)
      );

      return CreateArray(ctx.data, node, { validity, offsets, values });
    }

    arrow::Result<ArrowArrayHolder> MmapFixedSizeBinary(MapContext& ctx, const NodeCounts& node) {
      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));

      // only rows + 1 bytes are required, not rows * byte_width
      ARROW_ASSIGN_OR_RAISE(
         auto values
        ,GetBuffer<uint8_t>(*ctx.data, ctx.block_offset, ctx.buffers, node.length + 1)
      );

      return CreateArray(ctx.data, node, { validity, values });
    }

    arrow::Result<ArrowArrayHolder>
    MmapPrimitiveType(MapContext& ctx, const NodeCounts& node, arrow::Type::type type_id) {
      switch (type_id) {
        case arrow::Type::INT8:       return MmapPrimitive<int8_t>  (ctx, node);
        case arrow::Type::UINT8:      return MmapPrimitive<uint8_t> (ctx, node);
        case arrow::Type::INT16:      return MmapPrimitive<int16_t> (ctx, node);
        case arrow::Type::UINT16:     return MmapPrimitive<uint16_t>(ctx, node);
        case arrow::Type::INT32:      return MmapPrimitive<int32_t> (ctx, node);
        case arrow::Type::UINT32:     return MmapPrimitive<uint32_t>(ctx, node);
        case arrow::Type::INT64:      return MmapPrimitive<int64_t> (ctx, node);
        case arrow::Type::UINT64:     return MmapPrimitive<uint64_t>(ctx, node);
        case arrow::Type::HALF_FLOAT: return MmapPrimitive<uint16_t>(ctx, node);
        case arrow::Type::FLOAT:      return MmapPrimitive<float>   (ctx, node);
        case arrow::Type::DOUBLE:     return MmapPrimitive<double>  (ctx, node);

        case arrow::Type::DATE32:
        case arrow::Type::TIME32:
        case arrow::Type::INTERVAL_MONTHS:
          return MmapPrimitive<int32_t>(ctx, node);

        case arrow::Type::DATE64:
        case arrow::Type::TIME64:
        case arrow::Type::TIMESTAMP:
        case arrow::Type::DURATION:
          return MmapPrimitive<int64_t>(ctx, node);

        case arrow::Type::INTERVAL_DAY_TIME:
          return MmapPrimitive<arrow::DayTimeIntervalType::DayMilliseconds>(ctx, node);

        case arrow::Type::INTERVAL_MONTH_DAY_NANO:
          return MmapPrimitive<arrow::MonthDayNanoIntervalType::MonthDayNanos>(ctx, node);

        case arrow::Type::DECIMAL128: return MmapPrimitive<arrow::Decimal128>(ctx, node);
        case arrow::Type::DECIMAL256: return MmapPrimitive<arrow::Decimal256>(ctx, node);

        default:
          break;
      }

      return OutOfSpec(
         OutOfSpecKind::kUnsupportedType
        ,"no primitive layout for type id " + std::to_string(static_cast<int>(type_id))
      );
    }


    // >> Nested layouts

    template <typename OffsetType>
    arrow::Result<ArrowArrayHolder>
    MmapList( MapContext&            ctx
             ,const NodeCounts&      node
             ,const arrow::DataType& type
             ,const IpcField&        ipc_field) {
      ARROW_RETURN_NOT_OK(CheckChildFields(type, ipc_field));

      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));
      ARROW_ASSIGN_OR_RAISE(
         auto offsets
        ,GetBuffer<OffsetType>(*ctx.data, ctx.block_offset, ctx.buffers, node.length + 1)
      );

      ARROW_ASSIGN_OR_RAISE(auto values, MapNode(ctx, *type.field(0)->type(), ipc_field.fields[0]));

      std::vector<ArrowArrayHolder> children;
      children.push_back(std::move(values));

      return CreateArray(ctx.data, node, { validity, offsets }, std::move(children));
    }

    arrow::Result<ArrowArrayHolder>
    MmapFixedSizeList( MapContext&            ctx
                      ,const NodeCounts&      node
                      ,const arrow::DataType& type
                      ,const IpcField&        ipc_field) {
      ARROW_RETURN_NOT_OK(CheckChildFields(type, ipc_field));

      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));
      ARROW_ASSIGN_OR_RAISE(auto values  , MapNode(ctx, *type.field(0)->type(), ipc_field.fields[0]));

      std::vector<ArrowArrayHolder> children;
      children.push_back(std::move(values));

      return CreateArray(ctx.data, node, { validity }, std::move(children));
    }

    arrow::Result<ArrowArrayHolder>
    MmapStruct( MapContext&            ctx
               ,const NodeCounts&      node
               ,const arrow::DataType& type
               ,const IpcField&        ipc_field) {
      ARROW_RETURN_NOT_OK(CheckChildFields(type, ipc_field));

      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));

      // children already built are released by the vector if a later one fails
      std::vector<ArrowArrayHolder> children;
      children.reserve(type.num_fields());
      for (int field_ndx = 0; field_ndx < type.num_fields(); ++field_ndx) {
        ARROW_ASSIGN_OR_RAISE(
           auto child
          ,MapNode(ctx, *type.field(field_ndx)->type(), ipc_field.fields[field_ndx])
        );
        children.push_back(std::move(child));
      }

      return CreateArray(ctx.data, node, { validity }, std::move(children));
    }


    // >> Dictionary layout

    template <typename IndexType>
    arrow::Result<ArrowArrayHolder>
    MmapDictionary(MapContext& ctx, const NodeCounts& node, const IpcField& ipc_field) {
      if (not ipc_field.dictionary_id.has_value()) {
        return OutOfSpec(OutOfSpecKind::kMissingDictionary, "dictionary field has no dictionary id");
      }

      const int64_t dictionary_id = *ipc_field.dictionary_id;
      const auto&   map_entry     = ctx.dictionaries.find(dictionary_id);
      if (map_entry == ctx.dictionaries.end() or map_entry->second == nullptr) {
        return OutOfSpec(
           OutOfSpecKind::kMissingDictionary
          ,"Missing dictionary with id " + std::to_string(dictionary_id)
        );
      }

      ARROW_ASSIGN_OR_RAISE(auto validity, MapValidity(ctx, node));
      ARROW_ASSIGN_OR_RAISE(
         auto indices
        ,GetBuffer<IndexType>(*ctx.data, ctx.block_offset, ctx.buffers, node.length)
      );

      // the dictionary gets its own handle, which keeps the dictionary array alive
      ArrowArray c_dictionary;
      ARROW_RETURN_NOT_OK(arrow::ExportArray(*map_entry->second, &c_dictionary));
      ArrowArrayHolder dictionary(&c_dictionary);

      return CreateArray(ctx.data, node, { validity, indices }, {}, std::move(dictionary));
    }

    arrow::Result<ArrowArrayHolder>
    MmapDictionaryType( MapContext&            ctx
                       ,const NodeCounts&      node
                       ,const arrow::DataType& type
                       ,const IpcField&        ipc_field) {
      const auto& dict_type = static_cast<const arrow::DictionaryType&>(type);

      switch (dict_type.index_type()->id()) {
        case arrow::Type::INT8:   return MmapDictionary<int8_t>  (ctx, node, ipc_field);
        case arrow::Type::UINT8:  return MmapDictionary<uint8_t> (ctx, node, ipc_field);
        case arrow::Type::INT16:  return MmapDictionary<int16_t> (ctx, node, ipc_field);
        case arrow::Type::UINT16: return MmapDictionary<uint16_t>(ctx, node, ipc_field);
        case arrow::Type::INT32:  return MmapDictionary<int32_t> (ctx, node, ipc_field);
        case arrow::Type::UINT32: return MmapDictionary<uint32_t>(ctx, node, ipc_field);
        case arrow::Type::INT64:  return MmapDictionary<int64_t> (ctx, node, ipc_field);
        case arrow::Type::UINT64: return MmapDictionary<uint64_t>(ctx, node, ipc_field);

        default:
          break;
      }

      return OutOfSpec(
         OutOfSpecKind::kUnsupportedType
        ,"dictionary index type " + dict_type.index_type()->ToString() + " is not an integer"
      );
    }


    // >> Type dispatch

    arrow::Result<ArrowArrayHolder>
    MapNode(MapContext& ctx, const arrow::DataType& type, const IpcField& ipc_field) {
      // popped before matching: every child pops its own node
      if (ctx.field_nodes.empty()) {
        return OutOfSpec(OutOfSpecKind::kExpectedNode, "IPC body has fewer field nodes than its schema");
      }

      FieldNode field_node = ctx.field_nodes.front();
      ctx.field_nodes.pop_front();
      ARROW_ASSIGN_OR_RAISE(auto node, ReadNode(field_node));

      const arrow::DataType& storage = StorageType(type);
      switch (GetPhysicalType(storage)) {
        case PhysicalType::kNull:            return MmapNull(ctx, node);
        case PhysicalType::kBoolean:         return MmapBoolean(ctx, node);
        case PhysicalType::kPrimitive:       return MmapPrimitiveType(ctx, node, storage.id());
        case PhysicalType::kBinary:          return MmapBinary<int32_t>(ctx, node);
        case PhysicalType::kLargeBinary:     return MmapBinary<int64_t>(ctx, node);
        case PhysicalType::kFixedSizeBinary: return MmapFixedSizeBinary(ctx, node);
        case PhysicalType::kList:            return MmapList<int32_t>(ctx, node, storage, ipc_field);
        case PhysicalType::kMap:             return MmapList<int32_t>(ctx, node, storage, ipc_field);
        case PhysicalType::kLargeList:       return MmapList<int64_t>(ctx, node, storage, ipc_field);
        case PhysicalType::kFixedSizeList:   return MmapFixedSizeList(ctx, node, storage, ipc_field);
        case PhysicalType::kStruct:          return MmapStruct(ctx, node, storage, ipc_field);
        case PhysicalType::kDictionary:      return MmapDictionaryType(ctx, node, storage, ipc_field);
        case PhysicalType::kUnsupported:     break;
      }

      return OutOfSpec(
         OutOfSpecKind::kUnsupportedType
        ,"mmap is not implemented for type " + type.ToString()
      );
    }

  } // anonymous namespace: ipcmap::<anonymous>


  const arrow::DataType& StorageType(const arrow::DataType& type) {
    if (type.id() == arrow::Type::EXTENSION) {
      const auto& ext_type = static_cast<const arrow::ExtensionType&>(type);
      return StorageType(*ext_type.storage_type());
    }

    return type;
  }

  PhysicalType GetPhysicalType(const arrow::DataType& type) {
    switch (type.id()) {
      case arrow::Type::NA:   return PhysicalType::kNull;
      case arrow::Type::BOOL: return PhysicalType::kBoolean;

      case arrow::Type::INT8:
      case arrow::Type::UINT8:
      case arrow::Type::INT16:
      case arrow::Type::UINT16:
      case arrow::Type::INT32:
      case arrow::Type::UINT32:
      case arrow::Type::INT64:
      case arrow::Type::UINT64:
      case arrow::Type::HALF_FLOAT:
      case arrow::Type::FLOAT:
      case arrow::Type::DOUBLE:
      case arrow::Type::DATE32:
      case arrow::Type::DATE64:
      case arrow::Type::TIME32:
      case arrow::Type::TIME64:
      case arrow::Type::TIMESTAMP:
      case arrow::Type::DURATION:
      case arrow::Type::INTERVAL_MONTHS:
      case arrow::Type::INTERVAL_DAY_TIME:
      case arrow::Type::INTERVAL_MONTH_DAY_NANO:
      case arrow::Type::DECIMAL128:
      case arrow::Type::DECIMAL256:
        return PhysicalType::kPrimitive;

      case arrow::Type::STRING:
      case arrow::Type::BINARY:
        return PhysicalType::kBinary;

      case arrow::Type::LARGE_STRING:
      case arrow::Type::LARGE_BINARY:
        return PhysicalType::kLargeBinary;

      case arrow::Type::FIXED_SIZE_BINARY: return PhysicalType::kFixedSizeBinary;
      case arrow::Type::LIST:              return PhysicalType::kList;
      case arrow::Type::LARGE_LIST:        return PhysicalType::kLargeList;
      case arrow::Type::FIXED_SIZE_LIST:   return PhysicalType::kFixedSizeList;
      case arrow::Type::STRUCT:            return PhysicalType::kStruct;
      case arrow::Type::MAP:               return PhysicalType::kMap;
      case arrow::Type::DICTIONARY:        return PhysicalType::kDictionary;
      case arrow::Type::EXTENSION:         return GetPhysicalType(StorageType(type));

      default:
        break;
    }

    return PhysicalType::kUnsupported;
  }


  // >> Mapping entry points

  arrow::Result<ArrowArrayHolder>
  MmapFfiArray( const std::shared_ptr<arrow::Buffer>& data
               ,int64_t                               block_offset
               ,const arrow::DataType&                type
               ,const IpcField&                       ipc_field
               ,const Dictionaries&                   dictionaries
               ,FieldNodeQueue&                       field_nodes
               ,IpcBufferQueue&                       buffers) {
    MapContext ctx { data, block_offset, dictionaries, field_nodes, buffers };

    return MapNode(ctx, type, ipc_field);
  }

  arrow::Result<std::shared_ptr<arrow::Array>>
  MmapArray( std::shared_ptr<arrow::Buffer>          data
            ,int64_t                                 block_offset
            ,const std::shared_ptr<arrow::DataType>& type
            ,const IpcField&                         ipc_field
            ,const Dictionaries&                     dictionaries
            ,FieldNodeQueue&                         field_nodes
            ,IpcBufferQueue&                         buffers
            ,const MmapOptions&                      options) {
    if (data == nullptr) { return arrow::Status::Invalid("No source buffer to map"); }

    if (not data->is_cpu()) {
      return arrow::Status::Invalid("Mapped IPC body is not CPU-accessible");
    }

    ARROW_RETURN_NOT_OK(FooterLength(block_offset, "block offset"));

    ARROW_ASSIGN_OR_RAISE(
       auto c_array
      ,MmapFfiArray(data, block_offset, *type, ipc_field, dictionaries, field_nodes, buffers)
    );

    // the import takes over the handle, even when it fails
    ARROW_ASSIGN_OR_RAISE(auto array, arrow::ImportArray(c_array.get(), type));

    switch (options.validation) {
      case ValidationLevel::kNone:       break;
      case ValidationLevel::kStructural: ARROW_RETURN_NOT_OK(array->Validate());     break;
      case ValidationLevel::kFull:       ARROW_RETURN_NOT_OK(array->ValidateFull()); break;
    }

    return array;
  }

  arrow::Result<std::shared_ptr<arrow::RecordBatch>>
  MmapRecordBatch( std::shared_ptr<arrow::Buffer>        data
                  ,int64_t                               block_offset
                  ,int64_t                               length
                  ,const std::shared_ptr<arrow::Schema>& schema
                  ,const std::vector<IpcField>&          ipc_fields
                  ,const Dictionaries&                   dictionaries
                  ,FieldNodeQueue&                       field_nodes
                  ,IpcBufferQueue&                       buffers
                  ,const MmapOptions&                    options) {
    ARROW_RETURN_NOT_OK(FooterLength(length, "record batch length"));

    const auto num_fields = static_cast<size_t>(schema->num_fields());
    if (ipc_fields.size() != num_fields) {
      return OutOfSpec(
         OutOfSpecKind::kFieldMetadataMismatch
        ,"schema has " + std::to_string(num_fields) + " fields but "
           + std::to_string(ipc_fields.size()) + " IPC fields were given"
      );
    }

    arrow::ArrayVector columns;
    columns.reserve(num_fields);
    for (size_t field_ndx = 0; field_ndx < num_fields; ++field_ndx) {
      ARROW_ASSIGN_OR_RAISE(
         auto column
        ,MmapArray(
            data
           ,block_offset
           ,schema->field(static_cast<int>(field_ndx))->type()
           ,ipc_fields[field_ndx]
           ,dictionaries
           ,field_nodes
           ,buffers
           ,options
         )
      );
      columns.push_back(std::move(column));
    }

    ARROW_LOG(DEBUG) << "Mapped record batch of " << length << " rows: "
                     << field_nodes.size() << " field nodes and "
                     << buffers.size()     << " buffers left over";

    if (options.require_exhaustive and (not field_nodes.empty() or not buffers.empty())) {
      return OutOfSpec(
         OutOfSpecKind::kUnconsumedBuffers
        ,"IPC body has " + std::to_string(field_nodes.size()) + " field nodes and "
           + std::to_string(buffers.size()) + " buffers that its schema does not use"
      );
    }

    auto batch = arrow::RecordBatch::Make(schema, length, std::move(columns));
    if (options.validation != ValidationLevel::kNone) {
      ARROW_RETURN_NOT_OK(batch->Validate());
    }

    return batch;
  }

  arrow::Result<std::shared_ptr<arrow::RecordBatch>>
  MmapRecordBatch( std::shared_ptr<arrow::Buffer>        data
                  ,const BatchLayout&                    layout
                  ,const std::shared_ptr<arrow::Schema>& schema
                  ,const std::vector<IpcField>&          ipc_fields
                  ,const Dictionaries&                   dictionaries
                  ,const MmapOptions&                    options) {
    auto field_nodes = layout.NodeQueue();
    auto buffers     = layout.BufferQueue();

    return MmapRecordBatch(
       std::move(data)
      ,layout.block_offset
      ,layout.length
      ,schema
      ,ipc_fields
      ,dictionaries
      ,field_nodes
      ,buffers
      ,options
    );
  }

} // namespace: ipcmap
