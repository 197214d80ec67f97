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
#include "zcarc/validation/shared_validator.hpp"
#include "zcarc/error.hpp"
#include "test_common.hpp"
#include <gtest/gtest.h>

namespace zcarc::test
{

TEST(Shared_validator, Registers_once)
{
  validation::Shared_validator validator(test_logger());
  const validation::Shared_validator::Type_id type_id(typeid(int32_t));

  Error_code err_code;
  EXPECT_TRUE(validator.register_shared_ptr(8, type_id, &err_code));
  EXPECT_FALSE(validator.register_shared_ptr(8, type_id, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(validator.register_shared_ptr(16, type_id, &err_code));
  EXPECT_EQ(validator.size(), 2u);
}

TEST(Shared_validator, Type_conflict)
{
  validation::Shared_validator validator(test_logger());

  Error_code err_code;
  EXPECT_TRUE(validator.register_shared_ptr(8, typeid(int32_t), &err_code));
  EXPECT_FALSE(validator.register_shared_ptr(8, typeid(uint32_t), &err_code));
  EXPECT_EQ(err_code, error::Code::S_VALIDATION_SHARED_TYPE_CONFLICT);
}

} // namespace zcarc::test
