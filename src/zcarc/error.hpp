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

#include "zcarc/common.hpp"
#include <istream>
#include <ostream>

/**
 * Namespace containing the zcarc module's extension of boost.system error conventions, so that zcarc APIs can
 * return codes/messages from within their own new set of error codes.  Every fallible zcarc operation reports
 * failure via a truthy #Error_code set to one of these; or, if the failure originated in a collaborator (e.g., a
 * user-supplied serialization routine for a nested value), to whatever #Error_code that collaborator emitted.
 *
 * All codes are fail-fast: once one is emitted, no partial result is produced, and the context object that
 * emitted it (serializer, validator) should be discarded.
 */
namespace zcarc::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via #Error_code arguments) by zcarc functions/methods *outside of* possibly
 * system-triggered errors and errors from user-supplied collaborators.
 */
enum class Code
{
  /// Layout computation: size (or size plus alignment padding) of an unsized pointee overflows addressable range.
  S_LAYOUT_OVERFLOW = S_CODE_LOWEST_INT_VALUE,

  /// Serialization: a relative pointer's offset (or slice length) is not representable in the archived field.
  S_SER_OFFSET_OUT_OF_RANGE,

  /// Serialization: fixed-capacity writer has no room for the bytes being written.
  S_SER_WRITER_CAPACITY_EXHAUSTED,

  /// Serialization: fixed-capacity scratch allocator has no room for the requested scratch area.
  S_SER_SCRATCH_CAPACITY_EXHAUSTED,

  /// Serialization: scratch area released other than in exact reverse order of acquisition.
  S_SER_SCRATCH_POPPED_OUT_OF_ORDER,

  /// Validation: pointee bytes do not lie entirely within the active subtree range.
  S_VALIDATION_POINTER_OUT_OF_BOUNDS,

  /// Validation: pointee address does not satisfy the pointee type's alignment.
  S_VALIDATION_POINTER_MISALIGNED,

  /// Validation: subtree range pushed that does not nest inside the active subtree range.
  S_VALIDATION_RANGE_UNDERFLOW,

  /// Validation: subtree range popped other than in exact reverse order of pushing.
  S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER,

  /// Validation: traversal finished with subtree ranges still pushed.
  S_VALIDATION_UNBALANCED_RANGES,

  /// Validation: subtree nesting exceeded the configured maximum depth.
  S_VALIDATION_SUBTREE_DEPTH_EXCEEDED,

  /// Validation: the same shared pointee address was claimed by two different archived types.
  S_VALIDATION_SHARED_TYPE_CONFLICT,

  /// Validation: archived bytes do not encode a legal value of their type (e.g., a `bool` other than 0 or 1).
  S_VALIDATION_INVALID_VALUE,

  /// Access: buffer start is not aligned as required by the root type.
  S_ACCESS_BUFFER_MISALIGNED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a matching #Error_code, whose category is the zcarc one.  This is
 * what allows `*err_code = Code::S_...` assignments throughout the library.
 *
 * @param err_code
 *        Code to convert.
 * @return Equivalent #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a zcarc::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code (case-insensitively);
 * or, if a number is read instead, it is interpreted as the numeric value of the Code.  If no match,
 * `Code::S_END_SENTINEL` results.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a zcarc::error::Code to a standard output stream: its symbol sans the `S_` prefix.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace zcarc::error

namespace boost::system
{

// Types.

/**
 * Specializing this is the boost.system-sanctioned way to make zcarc::error::Code convertible to
 * zcarc::Error_code.  The non-specialized version sets `value` to `false`, so that random arbitrary `enum`s
 * cannot be used as `Error_code`s.
 */
template<>
struct is_error_code_enum<::zcarc::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
