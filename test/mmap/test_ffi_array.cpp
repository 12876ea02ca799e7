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


#include "catch.hpp"
#include "test_helpers.hpp"

#include <vector>

#include "arrow/array.h"
#include "arrow/c/bridge.h"

#include "ipcmap/ffi_array.hpp"

using namespace ipcmap;

using Int32Values = std::vector<int32_t>;


namespace {

  int released_count = 0;

  void CountingRelease(ArrowArray* array) {
    ++released_count;
    array->release = nullptr;
  }

  //! A childless array whose release only counts calls
  ArrowArrayHolder CountingArray(int64_t length) {
    ArrowArray array;
    array.length       = length;
    array.null_count   = 0;
    array.offset       = 0;
    array.n_buffers    = 0;
    array.n_children   = 0;
    array.buffers      = nullptr;
    array.children     = nullptr;
    array.dictionary   = nullptr;
    array.release      = &CountingRelease;
    array.private_data = nullptr;

    return ArrowArrayHolder(&array);
  }

  ArrowArrayHolder Int32FfiArray(const std::shared_ptr<Int32Values>& owner) {
    return CreateFfiArray<Int32Values>(
       owner
      ,static_cast<int64_t>(owner->size())
      ,0
      ,{ nullptr, owner->data() }
      ,{}
      ,ArrowArrayHolder()
    );
  }

} // anonymous namespace


TEST_CASE("An FFI array exposes the given buffers and holds its owner", "[ffi]") {
  auto owner = std::make_shared<Int32Values>(Int32Values { 1, 2, 3 });

  auto holder = Int32FfiArray(owner);
  REQUIRE_FALSE(holder.is_released());
  REQUIRE(owner.use_count() == 2);

  REQUIRE(holder->length     == 3);
  REQUIRE(holder->null_count == 0);
  REQUIRE(holder->offset     == 0);
  REQUIRE(holder->n_buffers  == 2);
  REQUIRE(holder->n_children == 0);
  REQUIRE(holder->dictionary == nullptr);
  REQUIRE(holder->buffers[0] == nullptr);
  REQUIRE(holder->buffers[1] == owner->data());

  holder.Reset();
  REQUIRE(holder.is_released());
  REQUIRE(holder->private_data == nullptr);
  REQUIRE(owner.use_count() == 1);

  // releasing twice is harmless
  holder.Reset();
  REQUIRE(owner.use_count() == 1);
}

TEST_CASE("Releasing an FFI array releases its children and dictionary", "[ffi]") {
  released_count = 0;
  auto owner = std::make_shared<Int32Values>(Int32Values { 0, 1 });

  std::vector<ArrowArrayHolder> children;
  children.push_back(CountingArray(2));
  children.push_back(CountingArray(2));

  auto holder = CreateFfiArray<Int32Values>(
     owner, 2, 0, { nullptr }, std::move(children), CountingArray(5)
  );

  REQUIRE(holder->n_children == 2);
  REQUIRE(holder->children[0]->length == 2);
  REQUIRE(holder->dictionary != nullptr);
  REQUIRE(holder->dictionary->length == 5);
  REQUIRE(released_count == 0);

  holder.Reset();
  REQUIRE(released_count == 3);
  REQUIRE(owner.use_count() == 1);
}

TEST_CASE("Nested FFI arrays each keep the owner alive", "[ffi]") {
  auto owner = std::make_shared<Int32Values>(Int32Values { 7, 8, 9 });

  std::vector<ArrowArrayHolder> children;
  children.push_back(Int32FfiArray(owner));

  auto parent = CreateFfiArray<Int32Values>(
     owner, 3, 0, { nullptr }, std::move(children), ArrowArrayHolder()
  );
  REQUIRE(owner.use_count() == 3);

  parent.Reset();
  REQUIRE(owner.use_count() == 1);
}

TEST_CASE("ArrowArrayHolder transfers ownership on move", "[ffi]") {
  released_count = 0;

  SECTION("move construction") {
    {
      auto first  = CountingArray(1);
      auto second = std::move(first);

      REQUIRE(first.is_released());
      REQUIRE_FALSE(second.is_released());
    }
    REQUIRE(released_count == 1);
  }

  SECTION("move assignment releases the previous array") {
    {
      auto first  = CountingArray(1);
      auto second = CountingArray(2);

      second = std::move(first);
      REQUIRE(released_count == 1);
      REQUIRE(second->length == 1);
    }
    REQUIRE(released_count == 2);
  }

  SECTION("moving out to a consumer") {
    ArrowArray consumer;
    {
      auto holder = CountingArray(4);
      holder.MoveTo(&consumer);
      REQUIRE(holder.is_released());
    }
    REQUIRE(released_count == 0);
    REQUIRE(consumer.length == 4);

    ArrowArrayRelease(&consumer);
    REQUIRE(released_count == 1);
  }

  SECTION("detaching to the heap") {
    auto        holder   = CountingArray(3);
    ArrowArray* detached = holder.Detach();
    REQUIRE(holder.is_released());

    ArrowArrayRelease(detached);
    delete detached;
    REQUIRE(released_count == 1);
  }
}

TEST_CASE("The release callback ignores null and released arrays", "[ffi]") {
  ReleaseMappedArray<Int32Values>(nullptr);

  ArrowArray released;
  ArrowArrayMarkReleased(&released);
  ReleaseMappedArray<Int32Values>(&released);

  REQUIRE(ArrowArrayIsReleased(&released));
}

TEST_CASE("Arrow imports an FFI array over memory it does not own", "[ffi]") {
  auto owner = std::make_shared<Int32Values>(Int32Values { 4, 5, 6, 7 });
  auto holder = Int32FfiArray(owner);

  REQUIRE_RESULT(auto array, arrow::ImportArray(holder.get(), arrow::int32()));
  REQUIRE(holder.is_released());

  auto ints = std::static_pointer_cast<arrow::Int32Array>(array);
  REQUIRE(ints->length() == 4);
  REQUIRE(ints->null_count() == 0);
  REQUIRE(ints->raw_values() == owner->data());
  REQUIRE(ints->Value(3) == 7);

  REQUIRE(owner.use_count() == 2);
  ints.reset();
  array.reset();
  REQUIRE(owner.use_count() == 1);
}
