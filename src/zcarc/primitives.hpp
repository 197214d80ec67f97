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
#pragma once

#include "zcarc/zcarc_fwd.hpp"
#include "zcarc/error.hpp"
#include <boost/endian/arithmetic.hpp>

namespace zcarc
{

// Types.

/* Archived scalars.  Multi-byte ones are stored little-endian regardless of host, at their natural alignment; the
 * `boost::endian` aligned arithmetic types give exactly that, convert implicitly to/from the native type, and are
 * trivially copyable, so they can be used as archived fields as-is. */

/// Archived `int8_t`.
using Archived_i8 = boost::endian::little_int8_at;
/// Archived `int16_t`.
using Archived_i16 = boost::endian::little_int16_at;
/// Archived `int32_t`.  Also the offset field of Rel_ptr.
using Archived_i32 = boost::endian::little_int32_at;
/// Archived `int64_t`.
using Archived_i64 = boost::endian::little_int64_at;
/// Archived `uint8_t`.
using Archived_u8 = boost::endian::little_uint8_at;
/// Archived `uint16_t`.
using Archived_u16 = boost::endian::little_uint16_at;
/// Archived `uint32_t`.  Also the length field of slice Rel_ptr.
using Archived_u32 = boost::endian::little_uint32_at;
/// Archived `uint64_t`.
using Archived_u64 = boost::endian::little_uint64_at;
/// Archived `float` (IEEE 754 binary32).
using Archived_f32 = boost::endian::little_float32_at;
/// Archived `double` (IEEE 754 binary64).
using Archived_f64 = boost::endian::little_float64_at;

/**
 * Archived `bool`: one byte which, in a valid archive, is 0 or 1.  Unlike the other scalars not every byte value
 * is valid, since reading any other value as a C++ `bool` is undefined behavior; hence this is a distinct type with
 * its own check_bytes().
 */
class Archived_bool
{
public:
  // Constructors/destructor.

  /**
   * Constructs `false`.
   */
  Archived_bool();

  /**
   * Constructs the given value.
   *
   * @param val
   *        Value.
   */
  Archived_bool(bool val);

  // Methods.

  /**
   * Assigns the given value.
   *
   * @param val
   *        Value.
   * @return `*this`.
   */
  Archived_bool& operator=(bool val);

  /**
   * The value.  Behavior undefined unless check_bytes() passed (or the value was not read from untrusted bytes).
   * @return See above.
   */
  operator bool() const;

  /**
   * Validates the byte at `value`: it must be 0 or 1.  Works with any validation context, since there are no
   * pointers inside.
   *
   * @tparam Context
   *         Unused.
   * @param value
   *        Address of the (unvalidated) archived value.
   * @param err_code
   *        Must not be null.  error::Code::S_VALIDATION_INVALID_VALUE on failure.
   */
  template<typename Context>
  static void check_bytes(const Archived_bool* value, Context* context, Error_code* err_code);

private:
  // Data.

  /// 0 or 1 (in a valid archive).
  uint8_t m_byte;
}; // class Archived_bool

static_assert(sizeof(Archived_bool) == 1, "Archived bool must occupy exactly 1 byte.");
static_assert((sizeof(Archived_i32) == 4) && (alignof(Archived_i32) == 4),
              "boost::endian aligned types must be naturally sized and aligned.");

// Template implementations.

template<typename Context>
void Archived_bool::check_bytes(const Archived_bool* value, Context* context, Error_code* err_code) // Static.
{
  assert(err_code);
  if (value->m_byte > 1)
  {
    FLOW_LOG_SET_CONTEXT(context->get_logger(), Log_component::S_VALIDATION);
    FLOW_LOG_WARNING("Archived bool at position [" << (reinterpret_cast<const uint8_t*>(value) - context->base())
                     << "] holds [" << int(value->m_byte) << "]; only 0 and 1 are valid.  Emitting error.");
    *err_code = error::Code::S_VALIDATION_INVALID_VALUE;
  }
}

} // namespace zcarc
