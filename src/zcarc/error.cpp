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
#include "zcarc/error.hpp"
#include <flow/util/util.hpp>

namespace zcarc::error
{

// Types.

/**
 * The boost.system category for errors returned by the zcarc module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for example, printing an #Error_code storing a Code to
 * an `ostream` or calling `.message()` on it.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's name.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given error code value in this category.
   *
   * @param val
   *        Numeric value of a Code.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns the symbolic form of the given Code, sans the `S_` prefix; suitable for `ostream<<` and
   * (`istream>>`-able back via `flow::util::istream_to_enum()`).
   *
   * @param code
   *        Code.
   * @return See above.
   */
  static String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  // Glue together Category::name()/message() with the Code enum.
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "zcarc";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_LAYOUT_OVERFLOW:
    return "Layout computation: size (or size plus alignment padding) of an unsized pointee overflows "
           "addressable range.";
  case Code::S_SER_OFFSET_OUT_OF_RANGE:
    return "Serialization: a relative pointer's offset (or slice length) is not representable in the archived "
           "field.";
  case Code::S_SER_WRITER_CAPACITY_EXHAUSTED:
    return "Serialization: fixed-capacity writer has no room for the bytes being written.";
  case Code::S_SER_SCRATCH_CAPACITY_EXHAUSTED:
    return "Serialization: fixed-capacity scratch allocator has no room for the requested scratch area.";
  case Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER:
    return "Serialization: scratch area released other than in exact reverse order of acquisition.";
  case Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS:
    return "Validation: pointee bytes do not lie entirely within the active subtree range.";
  case Code::S_VALIDATION_POINTER_MISALIGNED:
    return "Validation: pointee address does not satisfy the pointee type's alignment.";
  case Code::S_VALIDATION_RANGE_UNDERFLOW:
    return "Validation: subtree range pushed that does not nest inside the active subtree range.";
  case Code::S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER:
    return "Validation: subtree range popped other than in exact reverse order of pushing.";
  case Code::S_VALIDATION_UNBALANCED_RANGES:
    return "Validation: traversal finished with subtree ranges still pushed.";
  case Code::S_VALIDATION_SUBTREE_DEPTH_EXCEEDED:
    return "Validation: subtree nesting exceeded the configured maximum depth.";
  case Code::S_VALIDATION_SHARED_TYPE_CONFLICT:
    return "Validation: the same shared pointee address was claimed by two different archived types.";
  case Code::S_VALIDATION_INVALID_VALUE:
    return "Validation: archived bytes do not encode a legal value of their type (e.g., a `bool` other than "
           "0 or 1).";
  case Code::S_ACCESS_BUFFER_MISALIGNED:
    return "Access: buffer start is not aligned as required by the root type.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_LAYOUT_OVERFLOW:
    return "LAYOUT_OVERFLOW";
  case Code::S_SER_OFFSET_OUT_OF_RANGE:
    return "SER_OFFSET_OUT_OF_RANGE";
  case Code::S_SER_WRITER_CAPACITY_EXHAUSTED:
    return "SER_WRITER_CAPACITY_EXHAUSTED";
  case Code::S_SER_SCRATCH_CAPACITY_EXHAUSTED:
    return "SER_SCRATCH_CAPACITY_EXHAUSTED";
  case Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER:
    return "SER_SCRATCH_POPPED_OUT_OF_ORDER";
  case Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS:
    return "VALIDATION_POINTER_OUT_OF_BOUNDS";
  case Code::S_VALIDATION_POINTER_MISALIGNED:
    return "VALIDATION_POINTER_MISALIGNED";
  case Code::S_VALIDATION_RANGE_UNDERFLOW:
    return "VALIDATION_RANGE_UNDERFLOW";
  case Code::S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER:
    return "VALIDATION_RANGE_POPPED_OUT_OF_ORDER";
  case Code::S_VALIDATION_UNBALANCED_RANGES:
    return "VALIDATION_UNBALANCED_RANGES";
  case Code::S_VALIDATION_SUBTREE_DEPTH_EXCEEDED:
    return "VALIDATION_SUBTREE_DEPTH_EXCEEDED";
  case Code::S_VALIDATION_SHARED_TYPE_CONFLICT:
    return "VALIDATION_SHARED_TYPE_CONFLICT";
  case Code::S_VALIDATION_INVALID_VALUE:
    return "VALIDATION_INVALID_VALUE";
  case Code::S_ACCESS_BUFFER_MISALIGNED:
    return "ACCESS_BUFFER_MISALIGNED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace zcarc::error
