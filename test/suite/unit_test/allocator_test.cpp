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
#include "zcarc/ser/allocator.hpp"
#include "zcarc/error.hpp"
#include "test_common.hpp"
#include <gtest/gtest.h>

namespace zcarc::test
{

TEST(Buffer_allocator, Lifo)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t area[64];
  ser::Buffer_allocator allocator(test_logger(), Blob_mutable(area, sizeof(area)));

  Error_code err_code;
  uint8_t* const ptr1 = allocator.push_alloc(Layout{ 3, 1 }, &err_code);
  ASSERT_FALSE(err_code);
  uint8_t* const ptr2 = allocator.push_alloc(Layout{ 8, 8 }, &err_code);
  ASSERT_FALSE(err_code);
  // Each allocation is followed by its 24-byte record: [0, 3) record [8, 32); [32, 40) record [40, 64).
  EXPECT_EQ(ptr1, area);
  EXPECT_EQ(ptr2, area + 32);
  EXPECT_EQ(allocator.depth(), 2u);
  EXPECT_EQ(allocator.used(), 64u);

  // Popping the older one first is refused.
  allocator.pop_alloc(ptr1, Layout{ 3, 1 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER);
  EXPECT_EQ(allocator.depth(), 2u);

  err_code.clear();
  allocator.pop_alloc(ptr2, Layout{ 8, 8 }, &err_code);
  ASSERT_FALSE(err_code);
  allocator.pop_alloc(ptr1, Layout{ 3, 1 }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(allocator.depth(), 0u);
  EXPECT_EQ(allocator.used(), 0u);
}

TEST(Buffer_allocator, Empty_allocation_does_not_hide_order)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t area[128];
  ser::Buffer_allocator allocator(test_logger(), Blob_mutable(area, sizeof(area)));

  Error_code err_code;
  uint8_t* const ptr1 = allocator.push_alloc(Layout{ 8, 8 }, &err_code);
  ASSERT_FALSE(err_code);
  uint8_t* const ptr2 = allocator.push_alloc(Layout{ 0, 1 }, &err_code);
  ASSERT_FALSE(err_code);

  allocator.pop_alloc(ptr1, Layout{ 8, 8 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER);
  EXPECT_EQ(allocator.depth(), 2u);

  // Right pointer, wrong size.
  err_code.clear();
  allocator.pop_alloc(ptr2, Layout{ 4, 1 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER);

  err_code.clear();
  allocator.pop_alloc(ptr2, Layout{ 0, 1 }, &err_code);
  ASSERT_FALSE(err_code);
  allocator.pop_alloc(ptr1, Layout{ 8, 8 }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(allocator.used(), 0u);
}

TEST(Buffer_allocator, Pop_rewinds_padding)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t area[128];
  ser::Buffer_allocator allocator(test_logger(), Blob_mutable(area, sizeof(area)));

  Error_code err_code;
  allocator.push_alloc(Layout{ 9, 1 }, &err_code);
  ASSERT_FALSE(err_code);
  const size_t used_before = allocator.used();

  // Aligned start leaves padding before the allocation; popping gives the padding back too.
  uint8_t* const ptr = allocator.push_alloc(Layout{ 4, 16 }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(reinterpret_cast<uintptr_t>(ptr) % 16, 0u);
  allocator.pop_alloc(ptr, Layout{ 4, 16 }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(allocator.used(), used_before);
  EXPECT_EQ(allocator.depth(), 1u);
}

TEST(Buffer_allocator, Capacity_exhausted)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t area[48];
  ser::Buffer_allocator allocator(test_logger(), Blob_mutable(area, sizeof(area)));

  Error_code err_code;
  allocator.push_alloc(Layout{ 12, 4 }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(allocator.push_alloc(Layout{ 8, 4 }, &err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_SER_SCRATCH_CAPACITY_EXHAUSTED);
}

TEST(Heap_allocator, Spills_into_new_blocks)
{
  ser::Heap_allocator allocator(ser::Heap_allocator::Config{ test_logger(), 32 });

  Error_code err_code;
  uint8_t* const ptr1 = allocator.push_alloc(Layout{ 24, 8 }, &err_code);
  ASSERT_FALSE(err_code);
  uint8_t* const ptr2 = allocator.push_alloc(Layout{ 100, 16 }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(allocator.n_blocks(), 2u);
  EXPECT_EQ(reinterpret_cast<uintptr_t>(ptr2) % 16, 0u);

  // Earlier allocation is untouched by the later one.
  ptr1[0] = 0xAB;
  ptr2[0] = 0xCD;
  EXPECT_EQ(ptr1[0], 0xAB);

  allocator.pop_alloc(ptr1, Layout{ 24, 8 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER);

  err_code.clear();
  allocator.pop_alloc(ptr2, Layout{ 100, 16 }, &err_code);
  ASSERT_FALSE(err_code);
  allocator.pop_alloc(ptr1, Layout{ 24, 8 }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(allocator.depth(), 0u);

  // Blocks are kept for reuse.
  EXPECT_EQ(allocator.push_alloc(Layout{ 24, 8 }, &err_code), ptr1);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(allocator.n_blocks(), 2u);
  allocator.pop_alloc(ptr1, Layout{ 24, 8 }, &err_code);
  EXPECT_FALSE(err_code);
}

TEST(Scratch_guard, Pops_on_scope_exit)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t area[64];
  ser::Buffer_allocator allocator(test_logger(), Blob_mutable(area, sizeof(area)));

  Error_code err_code;
  {
    ser::Scratch_guard<ser::Buffer_allocator> guard(&allocator);
    EXPECT_NE(guard.push(Layout{ 10, 2 }, &err_code), nullptr);
    ASSERT_FALSE(err_code);
    EXPECT_EQ(allocator.depth(), 1u);
  }
  EXPECT_EQ(allocator.depth(), 0u);

  ser::Scratch_guard<ser::Buffer_allocator> guard(&allocator);
  guard.push(Layout{ 0, 1 }, &err_code);
  ASSERT_FALSE(err_code);
  guard.release(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(allocator.depth(), 0u);
  guard.release(&err_code); // No-op now.
  EXPECT_FALSE(err_code);
}

} // namespace zcarc::test
