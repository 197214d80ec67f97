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
#include <ostream>

namespace zcarc
{

// Types.

/**
 * Size and alignment, in bytes, of a value's in-buffer representation: the C++ analog of `std::alignment_of`
 * plus `sizeof`, except that it is also computable at run time for unsized pointees (slices) from their
 * metadata (element count).
 *
 * A Layout is valid iff `m_align` is a power of 2 and `m_size`, rounded up to `m_align`, does not exceed
 * `PTRDIFF_MAX`.  The factories below never produce an invalid Layout; instead they emit
 * error::Code::S_LAYOUT_OVERFLOW.  Since an untrusted buffer can claim any element count, that error is an
 * ordinary validation failure, not a bug.
 */
struct Layout
{
  // Data.

  /// Number of bytes occupied.
  size_t m_size;

  /// Required alignment of the first byte; a power of 2.
  size_t m_align;

  // Methods.

  /**
   * Layout of sized type `T`.
   *
   * @tparam T
   *         Any complete type.
   * @return See above.
   */
  template<typename T>
  static constexpr Layout of();

  /**
   * Layout of an array of `n_elems` elements of layout `elem`.
   *
   * @param elem
   *        Layout of one element (its `m_size` is assumed to be a multiple of its `m_align`, as for any C++ type).
   * @param n_elems
   *        Element count; possibly untrusted.
   * @param err_code
   *        Must not be null.  error::Code::S_LAYOUT_OVERFLOW if the result would be invalid.
   * @return Resulting layout; meaningless if `*err_code` is truthy.
   */
  static Layout array(const Layout& elem, size_t n_elems, Error_code* err_code);

  /**
   * Returns a Layout with the given size and alignment; or emits error if they do not form a valid Layout.
   *
   * @param size
   *        See #m_size.
   * @param align
   *        See #m_align.
   * @param err_code
   *        Must not be null.  error::Code::S_LAYOUT_OVERFLOW if invalid.
   * @return See above.
   */
  static Layout from_size_align(size_t size, size_t align, Error_code* err_code);

  /**
   * `m_size` rounded up to a multiple of `m_align`.
   * @return See above.
   */
  size_t padded_size() const;
}; // struct Layout

// Free functions.

/**
 * Returns the smallest value `>= pos` that is a multiple of `align`.
 *
 * @param pos
 *        Position or size.
 * @param align
 *        Power of 2.
 * @return See above.
 */
constexpr size_t align_up(size_t pos, size_t align)
{
  return (pos + (align - 1)) & ~(align - 1);
}

/**
 * Prints string representation of the given Layout to the given `ostream`.
 *
 * @relatesalso Layout
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Layout& val);

/**
 * Returns `true` if and only if the two layouts are equal.
 *
 * @relatesalso Layout
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Layout& val1, const Layout& val2);

/**
 * Returns `!(val1 == val2)`.
 *
 * @relatesalso Layout
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Layout& val1, const Layout& val2);

// Template implementations.

template<typename T>
constexpr Layout Layout::of()
{
  return Layout{ sizeof(T), alignof(T) };
}

} // namespace zcarc
