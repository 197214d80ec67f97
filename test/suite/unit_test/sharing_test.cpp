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
#include "zcarc/ser/sharing.hpp"
#include "zcarc/error.hpp"
#include "test_common.hpp"
#include <gtest/gtest.h>

namespace zcarc::test
{

TEST(Unify, Records_positions)
{
  ser::Unify unify(test_logger());
  const int val1 = 1;
  const int val2 = 2;

  EXPECT_FALSE(unify.get_shared_ptr(&val1));

  Error_code err_code;
  unify.add_shared_ptr(&val1, 12, &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_TRUE(unify.get_shared_ptr(&val1));
  EXPECT_EQ(*unify.get_shared_ptr(&val1), 12u);
  EXPECT_FALSE(unify.get_shared_ptr(&val2));
  EXPECT_EQ(unify.size(), 1u);

  unify.clear();
  EXPECT_FALSE(unify.get_shared_ptr(&val1));
}

TEST(Duplicate, Never_records)
{
  ser::Duplicate duplicate;
  const int val = 1;

  Error_code err_code;
  duplicate.add_shared_ptr(&val, 12, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(duplicate.get_shared_ptr(&val));
}

TEST(Serialize_shared, Unify_serializes_once)
{
  ser::Unify unify(test_logger());
  const int val = 1;
  size_t n_calls = 0;
  const auto serialize_func = [&](Error_code*) -> size_t { return 100 + (n_calls++); };

  Error_code err_code;
  EXPECT_EQ(ser::serialize_shared(&unify, &val, serialize_func, &err_code), 100u);
  EXPECT_EQ(ser::serialize_shared(&unify, &val, serialize_func, &err_code), 100u);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(n_calls, 1u);
}

TEST(Serialize_shared, Duplicate_serializes_every_time)
{
  ser::Duplicate duplicate;
  const int val = 1;
  size_t n_calls = 0;
  const auto serialize_func = [&](Error_code*) -> size_t { return 100 + (n_calls++); };

  Error_code err_code;
  EXPECT_EQ(ser::serialize_shared(&duplicate, &val, serialize_func, &err_code), 100u);
  EXPECT_EQ(ser::serialize_shared(&duplicate, &val, serialize_func, &err_code), 101u);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(n_calls, 2u);
}

TEST(Serialize_shared, Failure_is_not_recorded)
{
  ser::Unify unify(test_logger());
  const int val = 1;

  Error_code err_code;
  ser::serialize_shared(&unify, &val,
                        [](Error_code* actual_err_code) -> size_t
                          {
                            *actual_err_code = error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED;
                            return 0;
                          },
                        &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED);
  EXPECT_FALSE(unify.get_shared_ptr(&val));
}

} // namespace zcarc::test
