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
#include "zcarc/validation/archive_validator.hpp"
#include "zcarc/error.hpp"
#include "test_common.hpp"
#include <gtest/gtest.h>

namespace zcarc::test
{

using validation::Archive_validator;
using validation::Subtree_range;

namespace
{

/// Fixture: a validator over a 64-byte, maximally aligned buffer.
class Archive_validator_test :
  public ::testing::Test
{
protected:
  Archive_validator_test() :
    m_validator(test_logger(), Blob_const(m_buf, sizeof(m_buf)))
  {
    // That's it.
  }

  alignas(S_BUFFER_ALIGNMENT) uint8_t m_buf[64] = {};
  Archive_validator m_validator;
}; // class Archive_validator_test

} // namespace (anon)

TEST_F(Archive_validator_test, Bounds_and_alignment)
{
  Error_code err_code;
  m_validator.check_subtree_ptr(4, Layout{ 4, 4 }, &err_code);
  EXPECT_FALSE(err_code);
  m_validator.check_subtree_ptr(56, Layout{ 8, 8 }, &err_code);
  EXPECT_FALSE(err_code);
  m_validator.check_subtree_ptr(64, Layout{ 0, 1 }, &err_code);
  EXPECT_FALSE(err_code);

  m_validator.check_subtree_ptr(60, Layout{ 8, 4 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS);

  err_code.clear();
  m_validator.check_subtree_ptr(65, Layout{ 0, 1 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS);

  err_code.clear();
  m_validator.check_subtree_ptr(2, Layout{ 4, 4 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_POINTER_MISALIGNED);
}

TEST_F(Archive_validator_test, Push_narrows_active_range)
{
  Error_code err_code;
  const auto range = m_validator.push_subtree_range(32, 40, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(range, (Subtree_range{ 40, 64 }));
  EXPECT_EQ(m_validator.active_range(), (Subtree_range{ 0, 32 }));
  EXPECT_EQ(m_validator.depth(), 1u);

  // The subtree just claimed, and everything after it, is now out of bounds.
  m_validator.check_subtree_ptr(32, Layout{ 4, 4 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS);
  err_code.clear();
  m_validator.check_subtree_ptr(28, Layout{ 4, 4 }, &err_code);
  EXPECT_FALSE(err_code);

  m_validator.pop_subtree_range(range, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(m_validator.active_range(), (Subtree_range{ 40, 64 }));
  EXPECT_EQ(m_validator.depth(), 0u);
  m_validator.check_balanced(&err_code);
  EXPECT_FALSE(err_code);
}

TEST_F(Archive_validator_test, Pop_out_of_order)
{
  Error_code err_code;
  const auto range1 = m_validator.push_subtree_range(32, 40, &err_code);
  ASSERT_FALSE(err_code);
  const auto range2 = m_validator.push_subtree_range(8, 16, &err_code);
  ASSERT_FALSE(err_code);

  m_validator.pop_subtree_range(range1, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER);
  EXPECT_EQ(m_validator.depth(), 2u);

  err_code.clear();
  m_validator.pop_subtree_range(range2, &err_code);
  ASSERT_FALSE(err_code);
  m_validator.pop_subtree_range(range1, &err_code);
  ASSERT_FALSE(err_code);
  m_validator.check_balanced(&err_code);
  EXPECT_FALSE(err_code);
}

TEST_F(Archive_validator_test, Pop_with_nothing_pushed)
{
  Error_code err_code;
  m_validator.pop_subtree_range(Subtree_range{ 0, 64 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER);
}

TEST_F(Archive_validator_test, Push_outside_active_range)
{
  Error_code err_code;
  m_validator.push_subtree_range(32, 40, &err_code);
  ASSERT_FALSE(err_code);

  m_validator.push_subtree_range(30, 36, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_RANGE_UNDERFLOW);

  err_code.clear();
  m_validator.push_subtree_range(16, 8, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_RANGE_UNDERFLOW);
  EXPECT_EQ(m_validator.depth(), 1u);
}

TEST_F(Archive_validator_test, Unbalanced)
{
  Error_code err_code;
  m_validator.push_subtree_range(0, 8, &err_code);
  ASSERT_FALSE(err_code);
  m_validator.check_balanced(&err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_UNBALANCED_RANGES);
}

TEST(Archive_validator, Max_depth)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t buf[64] = {};
  Archive_validator validator(test_logger(), Blob_const(buf, sizeof(buf)), 2);

  Error_code err_code;
  validator.push_subtree_range(32, 40, &err_code);
  validator.push_subtree_range(16, 24, &err_code);
  ASSERT_FALSE(err_code);
  validator.push_subtree_range(0, 8, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_SUBTREE_DEPTH_EXCEEDED);
  EXPECT_EQ(validator.depth(), 2u);
}

} // namespace zcarc::test
