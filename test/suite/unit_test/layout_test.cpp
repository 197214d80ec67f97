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
#include "zcarc/layout.hpp"
#include "zcarc/error.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace zcarc::test
{

TEST(Layout, Of_type)
{
  constexpr auto layout = Layout::of<uint64_t>();
  EXPECT_EQ(layout.m_size, sizeof(uint64_t));
  EXPECT_EQ(layout.m_align, alignof(uint64_t));
  EXPECT_EQ(layout, (Layout{ sizeof(uint64_t), alignof(uint64_t) }));
}

TEST(Layout, Array)
{
  Error_code err_code;
  const auto layout = Layout::array(Layout{ 6, 4 }, 3, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(layout, (Layout{ 24, 4 })); // Stride is the padded size.

  const auto empty = Layout::array(Layout{ 4, 4 }, 0, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(empty, (Layout{ 0, 4 }));
}

TEST(Layout, Overflow)
{
  constexpr auto MAX_SZ = std::numeric_limits<size_t>::max();

  Error_code err_code;
  Layout::array(Layout{ 8, 8 }, (MAX_SZ / 8) + 1, &err_code);
  EXPECT_EQ(err_code, error::Code::S_LAYOUT_OVERFLOW);

  err_code.clear();
  Layout::from_size_align(MAX_SZ - 2, 4, &err_code);
  EXPECT_EQ(err_code, error::Code::S_LAYOUT_OVERFLOW);

  err_code.clear();
  Layout::from_size_align(100, 8, &err_code);
  EXPECT_FALSE(err_code);
}

TEST(Layout, Align_up)
{
  EXPECT_EQ(align_up(0, 4), 0u);
  EXPECT_EQ(align_up(1, 4), 4u);
  EXPECT_EQ(align_up(4, 4), 4u);
  EXPECT_EQ(align_up(13, 8), 16u);
  EXPECT_EQ((Layout{ 5, 4 }).padded_size(), 8u);
}

} // namespace zcarc::test
