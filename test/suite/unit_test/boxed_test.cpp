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
#include "zcarc/boxed.hpp"
#include "zcarc/primitives.hpp"
#include "zcarc/error.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <algorithm>
#include <new>

namespace zcarc::test
{

namespace
{

using U32_box = Archived_box<Archived_u32>;
using Chars_box = Archived_box<char[]>;

/// Constructs a box at `pos` in `buf` pointing back to position `to_pos`.
template<typename Box>
Box* emplace_box(uint8_t* buf, size_t pos, size_t to_pos, typename Box::Metadata metadata)
{
  auto* const box = new (buf + pos) Box();
  Error_code err_code;
  Box::resolve_from_raw_parts(Box_resolver{ to_pos }, metadata, Place<Box>(pos, box), &err_code);
  EXPECT_FALSE(err_code);
  return box;
}

} // namespace (anon)

TEST(Archived_box, Compares_and_prints_pointee)
{
  // Values 7, 7, 9 at [0, 12); a box to each at [12, 24).
  alignas(8) uint8_t buf[24] = {};
  new (buf) Archived_u32(7);
  new (buf + 4) Archived_u32(7);
  new (buf + 8) Archived_u32(9);
  const auto* const box1 = emplace_box<U32_box>(buf, 12, 0, No_metadata());
  const auto* const box2 = emplace_box<U32_box>(buf, 16, 4, No_metadata());
  const auto* const box3 = emplace_box<U32_box>(buf, 20, 8, No_metadata());

  EXPECT_NE(&box1->get(), &box2->get());
  EXPECT_TRUE(*box1 == *box2);
  EXPECT_TRUE(*box1 != *box3);
  EXPECT_TRUE(*box1 < *box3);
  EXPECT_FALSE(*box3 < *box1);
  EXPECT_FALSE(*box1 < *box2);

  std::ostringstream os;
  os << *box3;
  EXPECT_EQ(os.str(), "9");
}

TEST(Archived_box, Slice_compares_elements)
{
  // "ab" at [0, 2), "ab" at [2, 4), "abc" at [4, 7); boxes at [8, 16), [16, 24), [24, 32).
  alignas(8) uint8_t buf[32] = {};
  const char chars[] = "ababab";
  std::copy(chars, chars + 4, buf);
  std::copy(chars, chars + 3, buf + 4);
  const auto* const box1 = emplace_box<Chars_box>(buf, 8, 0, 2);
  const auto* const box2 = emplace_box<Chars_box>(buf, 16, 2, 2);
  const auto* const box3 = emplace_box<Chars_box>(buf, 24, 4, 3);

  EXPECT_TRUE(*box1 == *box2);
  EXPECT_TRUE(*box1 != *box3);
  EXPECT_TRUE(*box1 < *box3); // Proper prefix.

  std::ostringstream os;
  os << *box3;
  EXPECT_EQ(os.str(), "aba");
}

} // namespace zcarc::test
