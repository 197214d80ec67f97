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
#include <typeindex>

namespace zcarc::validation
{

// Types.

/**
 * Validation context for shared pointers (Archived_rc): remembers which positions have been validated as the
 * pointee of a shared pointer, and as what type.  The first pointer to reach a position validates the pointee (and
 * claims its bytes in the Archive_validator); later pointers to that position skip both.  A later pointer claiming
 * the same position as a *different* type is rejected, as reading the same bytes as two unrelated types is how a
 * malicious buffer would smuggle in an invalid value.
 *
 * Types are identified by #Type_id, `std::type_index`, so any archived type (including user-defined ones) can be
 * registered without zcarc knowing about it.
 */
class Shared_validator :
  public flow::log::Log_context
{
public:
  // Types.

  /// Identity of an archived type.
  using Type_id = std::type_index;

  // Constructors/destructor.

  /**
   * Constructs empty registry.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Shared_validator(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Registers a shared pointee at position `pos` with type `type_id`.
   *
   * @param pos
   *        Position of shared pointee.
   * @param type_id
   *        Its archived type.
   * @param err_code
   *        Must not be null.  error::Code::S_VALIDATION_SHARED_TYPE_CONFLICT if `pos` was registered with a different
   *        `type_id`.
   * @return `true` if `pos` was not registered before (caller must now validate the pointee); `false` if it was,
   *         with the same type (already validated).  Meaningless on error.
   */
  bool register_shared_ptr(size_t pos, const Type_id& type_id, Error_code* err_code);

  /**
   * Number of distinct positions registered.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// Position => type registered there.
  boost::unordered_map<size_t, Type_id> m_registry;
}; // class Shared_validator

// Free functions.

/**
 * Prints string representation of the given validator to the given `ostream`.
 *
 * @relatesalso Shared_validator
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Shared_validator& val);

} // namespace zcarc::validation
