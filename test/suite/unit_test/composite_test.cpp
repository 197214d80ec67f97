/* zcarc: Zero-Copy Archive
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "zcarc/zcarc.hpp"
#include "test_common.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>

namespace zcarc::test
{

namespace
{

using Shared_strings = std::vector<std::shared_ptr<std::string>>;

/// Heap_serializer but archiving every shared pointer separately.
using Heap_duplicate_serializer = ser::Composite_serializer<ser::Heap_writer, ser::Heap_allocator, ser::Duplicate>;

Shared_strings make_shared_strings()
{
  const auto shared_val = std::make_shared<std::string>("shared value");
  return Shared_strings{ shared_val, shared_val };
}

} // namespace (anon)

TEST(Core_serializer, Archive_into_fixed_buffers)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t target[64];
  alignas(S_BUFFER_ALIGNMENT) uint8_t scratch[64];
  auto serializer = ser::make_core_serializer(test_logger(), Blob_mutable(target, sizeof(target)),
                                              Blob_mutable(scratch, sizeof(scratch)));

  const std::vector<int32_t> val{ 1, 2, 3 };
  Error_code err_code;
  const size_t root_pos = ser::serialize_using(val, &serializer, &err_code);
  ASSERT_FALSE(err_code);
  // Elements at [0, 12), then the vector itself.
  EXPECT_EQ(root_pos, 12u);
  EXPECT_EQ(serializer.pos(), 20u);
  EXPECT_EQ(serializer.allocator().depth(), 0u);

  const auto written = serializer.writer().written();
  const auto archived = access<Archived<std::vector<int32_t>>>(test_logger(), written, &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_EQ(archived->size(), 3u);
  EXPECT_EQ(static_cast<int32_t>((*archived)[2]), 3);
}

TEST(Core_serializer, Writer_capacity_exhausted)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t target[8];
  alignas(S_BUFFER_ALIGNMENT) uint8_t scratch[64];
  auto serializer = ser::make_core_serializer(test_logger(), Blob_mutable(target, sizeof(target)),
                                              Blob_mutable(scratch, sizeof(scratch)));

  Error_code err_code;
  ser::serialize_using(std::string("hello"), &serializer, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED);
}

TEST(Core_serializer, Writer_capacity_exhausted_throws)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t target[8];
  alignas(S_BUFFER_ALIGNMENT) uint8_t scratch[64];
  auto serializer = ser::make_core_serializer(test_logger(), Blob_mutable(target, sizeof(target)),
                                              Blob_mutable(scratch, sizeof(scratch)));

  try
  {
    ser::serialize_using(std::string("hello"), &serializer);
    FAIL() << "Expected exception.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED);
  }
}

TEST(Core_serializer, Writer_exhausted_while_holding_scratch)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t target[16];
  alignas(S_BUFFER_ALIGNMENT) uint8_t scratch[256];
  auto serializer = ser::make_core_serializer(test_logger(), Blob_mutable(target, sizeof(target)),
                                              Blob_mutable(scratch, sizeof(scratch)));

  /* Chars at [0, 3); the strings from 4 on, 8 bytes each, so the second one does not fit.  The element resolvers are
   * in scratch at that point. */
  Error_code err_code;
  ser::serialize_using(std::vector<std::string>{ "a", "b", "c" }, &serializer, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED);
  EXPECT_EQ(serializer.allocator().depth(), 0u);
  EXPECT_EQ(serializer.allocator().used(), 0u);

  // The same scratch serves a fresh attempt.
  alignas(S_BUFFER_ALIGNMENT) uint8_t retry_target[64];
  auto parts = std::move(serializer).into_raw_parts();
  ser::Core_serializer retry(test_logger(),
                             ser::Buffer_writer(test_logger(), Blob_mutable(retry_target, sizeof(retry_target))),
                             std::move(std::get<1>(parts)), ser::Duplicate());
  err_code.clear();
  ser::serialize_using(std::vector<std::string>{ "a" }, &retry, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(retry.allocator().depth(), 0u);

  const auto archived = access<Archived<std::vector<std::string>>>(test_logger(), retry.writer().written(),
                                                                    &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_EQ(archived->size(), 1u);
  EXPECT_EQ((*archived)[0], "a");
}

TEST(Core_serializer, Scratch_capacity_exhausted)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t target[256];
  alignas(S_BUFFER_ALIGNMENT) uint8_t scratch[4];
  auto serializer = ser::make_core_serializer(test_logger(), Blob_mutable(target, sizeof(target)),
                                              Blob_mutable(scratch, sizeof(scratch)));

  // One resolver per element has to be held while the elements' own data is written.
  const std::vector<std::string> val{ "a", "b", "c" };
  Error_code err_code;
  ser::serialize_using(val, &serializer, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_SCRATCH_CAPACITY_EXHAUSTED);
}

TEST(Composite_serializer, Unify_archives_shared_value_once)
{
  const auto val = make_shared_strings();

  auto unify_serializer = ser::make_heap_serializer(test_logger());
  Error_code err_code;
  ser::serialize_using(val, &unify_serializer, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(unify_serializer.sharing().size(), 1u);

  Heap_duplicate_serializer duplicate_serializer(test_logger(),
                                                 ser::Heap_writer(ser::Heap_writer::Config{ test_logger(), 0 }),
                                                 ser::Heap_allocator(ser::Heap_allocator::Config{ test_logger(), 0 }),
                                                 ser::Duplicate());
  ser::serialize_using(val, &duplicate_serializer, &err_code);
  ASSERT_FALSE(err_code);

  /* Unify: chars [0, 12), string [12, 20), 2 pointers [20, 28), vector [28, 36).
   * Duplicate: the chars and the string twice, so everything after shifts by 20. */
  EXPECT_EQ(unify_serializer.pos(), 36u);
  EXPECT_EQ(duplicate_serializer.pos(), 56u);

  // Both are valid archives; only the Unify one shares the pointee.
  const auto unify_bytes = std::get<0>(std::move(unify_serializer).into_raw_parts()).into_blob();
  const auto duplicate_bytes = std::get<0>(std::move(duplicate_serializer).into_raw_parts()).into_blob();

  const auto unified = access<Archived<Shared_strings>>
                         (test_logger(), Blob_const(unify_bytes.const_data(), unify_bytes.size()), &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(&(*unified)[0].get(), &(*unified)[1].get());

  const auto duplicated = access<Archived<Shared_strings>>
                            (test_logger(), Blob_const(duplicate_bytes.const_data(), duplicate_bytes.size()),
                             &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_NE(&(*duplicated)[0].get(), &(*duplicated)[1].get());
  EXPECT_EQ((*duplicated)[0].get(), (*duplicated)[1].get().as_str());
}

} // namespace zcarc::test
